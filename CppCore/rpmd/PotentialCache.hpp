#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Header file for the PotentialCache class.
 *
 * Persistent storage of ring polymer potential evaluations in RocksDB. One
 * entry holds the bead energies and the bead-resolved potential gradient of
 * a complete ring polymer configuration.
 */

#include <optional>
#include <rocksdb/db.h>
#include <string>
#include <vector>

#include "rpmd/pot_types.hpp"
#include "rpmd/types/BeadArray.hpp"

namespace rpmd::cache {

/**
 * @class KeyHash
 * @brief Struct to hold the hash and string key for caching.
 * @ingroup rpmd_cache
 */
struct KeyHash {
  size_t hash;     //!< The numeric hash value.
  std::string key; //!< The string representation of the hash.

  /**
   * @brief Constructor for KeyHash.
   * @param _hash The numeric hash to wrap.
   */
  KeyHash(size_t _hash) : hash{_hash}, key(std::to_string(_hash)) {}
};

/**
 * @brief Hashes a ring polymer configuration for a given potential.
 * @param q Bead positions.
 * @param type The potential that will be evaluated.
 * @param parameters The potential's model parameters.
 * @return Key combining positions, shape, potential type and parameters.
 */
KeyHash hash_configuration(const types::BeadArray &q, PotType type,
                           const std::vector<double> &parameters = {});

/**
 * @class PotentialCache
 * @brief Caches ring polymer potential evaluations using RocksDB.
 * @ingroup rpmd_cache
 */
class PotentialCache {
private:
  rocksdb::DB *db_ = nullptr; //!< Pointer to the RocksDB instance.
  bool own_db_ = false;       //!< Ownership flag for the DB pointer.

public:
  /**
   * @brief Constructor opens the DB at the given path.
   * @param db_path Path to the RocksDB database.
   * @param create_if_missing Toggle creation of DB if absent.
   */
  explicit PotentialCache(const std::string &db_path,
                          bool create_if_missing = true);

  PotentialCache() = default;
  PotentialCache(const PotentialCache &) = delete;
  PotentialCache &operator=(const PotentialCache &) = delete;
  ~PotentialCache();

  /**
   * @brief Helper for manual pointer setting.
   * @param db Pointer to an existing RocksDB instance, not owned.
   * @return Void.
   */
  void set_db(rocksdb::DB *db);

  /**
   * @brief Whether a database is attached.
   * @return False for a pass-through cache.
   */
  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

  /**
   * @brief Deserializes a cache hit into output containers.
   * @param value Serialized string from the cache.
   * @param V Bead energies; must already have the expected length.
   * @param dVdq Bead-resolved gradient; must already have the expected
   * shape.
   * @return False if the stored record does not match the output sizes, in
   * which case the outputs are untouched.
   */
  bool deserialize_hit(const std::string &value, std::vector<double> &V,
                       types::BeadArray &dVdq) const;

  /**
   * @brief Adds a serialized evaluation to the cache.
   * @param key Unique hash key for the configuration.
   * @param V Bead energies.
   * @param dVdq Bead-resolved gradient.
   * @return Void.
   */
  void add_serialized(const KeyHash &key, const std::vector<double> &V,
                      const types::BeadArray &dVdq);

  /**
   * @brief Searches the cache for a specific key.
   * @param key Unique hash key.
   * @return Optional string containing the serialized data.
   */
  std::optional<std::string> find(const KeyHash &key);
};

} // namespace rpmd::cache
