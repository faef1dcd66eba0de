/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/rocksdb/Storage.h>
#include <kvorm/kvorm.h>

namespace kvorm::rocksdb {

/////////////////////////////////////////////////////////////////////////////
/// Create an EntityManager over a RocksDB database.
/// @param path The database directory, created if missing.
/// @param config Identifier converter and mapping driver configuration.
/// @param options RocksDB and error reporting options.
/////////////////////////////////////////////////////////////////////////////
inline
std::unique_ptr<EntityManager> open(const std::filesystem::path& path, const Configuration& config, Options options = {}) {
    auto p_storage = std::make_shared<Storage>(path, options);
    return std::make_unique<EntityManager>(p_storage, config.new_metadata_factory(), config);
}

} // namespace kvorm::rocksdb
