// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of the RocksDB-based potential cache.
 */

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <cstring>
#include <fmt/core.h>
#include <rocksdb/options.h>
#include <vector>

#include "rpmd/PotentialCache.hpp"

namespace rpmd::cache {

/**
 * @details
 * Hashes the positions, the [nAtoms, nBeads] shape, the potential type and
 * its parameters separately and XORs the results, so that equal coordinates
 * of differently shaped systems or differently parametrized potentials never
 * share a key.
 */
KeyHash hash_configuration(const types::BeadArray &q, PotType type,
                           const std::vector<double> &parameters) {
  size_t hash_val = 0;
  hash_val ^= XXH3_64bits(q.data(), q.size() * sizeof(double));
  const size_t shape[2]{q.natoms(), q.nbeads()};
  hash_val ^= XXH3_64bits_withSeed(shape, sizeof(shape), 1);
  size_t type_val = static_cast<size_t>(type);
  hash_val ^= XXH3_64bits_withSeed(&type_val, sizeof(size_t), 2);
  hash_val ^= XXH3_64bits_withSeed(parameters.data(),
                                   parameters.size() * sizeof(double), 3);
  return KeyHash(hash_val);
}

/**
 * @details
 * If the open fails an error is printed to stderr and the cache stays a
 * pass-through.
 */
PotentialCache::PotentialCache(const std::string &db_path,
                               bool create_if_missing) {
  rocksdb::Options options;
  options.create_if_missing = create_if_missing;
  rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db_);
  if (!status.ok()) {
    fmt::print(stderr, "Unable to open RocksDB at {}: {}\n", db_path,
               status.ToString());
    db_ = nullptr;
  } else {
    own_db_ = true;
  }
}

PotentialCache::~PotentialCache() {
  if (own_db_ && db_) {
    delete db_;
  }
}

/**
 * @details
 * A database owned by this instance is closed first. Ownership of @a db
 * stays with the caller.
 */
void PotentialCache::set_db(rocksdb::DB *db) {
  if (own_db_ && db_)
    delete db_;
  db_ = db;
  own_db_ = false;
}

/**
 * @details
 * The layout is `[V_0 ... V_{N-1}] [dVdq flat, bead index fastest]`.
 */
bool PotentialCache::deserialize_hit(const std::string &hit,
                                     std::vector<double> &V,
                                     types::BeadArray &dVdq) const {
  const size_t expected = (V.size() + dVdq.size()) * sizeof(double);
  if (hit.size() != expected) {
    return false;
  }
  std::memcpy(V.data(), hit.data(), V.size() * sizeof(double));
  std::memcpy(dVdq.data(), hit.data() + V.size() * sizeof(double),
              dVdq.size() * sizeof(double));
  return true;
}

void PotentialCache::add_serialized(const KeyHash &kv,
                                    const std::vector<double> &V,
                                    const types::BeadArray &dVdq) {
  if (!db_)
    return;
  std::vector<char> buffer((V.size() + dVdq.size()) * sizeof(double));
  std::memcpy(buffer.data(), V.data(), V.size() * sizeof(double));
  std::memcpy(buffer.data() + V.size() * sizeof(double), dVdq.data(),
              dVdq.size() * sizeof(double));

  rocksdb::Slice value(buffer.data(), buffer.size());
  rocksdb::Status status = db_->Put(rocksdb::WriteOptions(), kv.key, value);
  if (!status.ok()) {
    fmt::print(stderr, "Failed to store cache entry {}: {}\n", kv.key,
               status.ToString());
  }
}

std::optional<std::string> PotentialCache::find(const KeyHash &kv) {
  if (!db_)
    return std::nullopt;
  std::string value;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), kv.key, &value);
  if (s.ok()) {
    return value;
  }
  return std::nullopt;
}

} // namespace rpmd::cache
