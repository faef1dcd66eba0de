/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/storage/Storage.h>
#include <kvorm/core/serialize.h>
#include <kvorm/core/errors.h>
#include <kvorm/parser/json.h>
#include <kvorm/support/logging.h>

#include "DBManager.h"

#include <rocksdb/db.h>
#include <rocksdb/write_batch.h>
#include <filesystem>

namespace kvorm::rocksdb {

struct Options
{
    Options() { db.create_if_missing = true; }

    ::rocksdb::Options db;
    ::rocksdb::ReadOptions read;
    ::rocksdb::WriteOptions write;

    /// @brief Logging control during read operations
    bool quiet_read = false;

    /// @brief Logging control during write operations
    bool quiet_write = false;

    /// @brief Throw StorageError when a read operation fails
    bool throw_read_error = true;

    /// @brief Throw StorageError when a write operation fails
    bool throw_write_error = true;
};

/////////////////////////////////////////////////////////////////////////////
/// Storage backed by a RocksDB database.
/// - The database key of a record is `<storage name>/<tagged identifier>`,
///   where the identifier is encoded by kvorm::serialize.
/// - Records are stored as JSON objects.
/// - Partial updates are applied by merging the change set into the stored
///   record, written in a single WriteBatch. If the stored record cannot
///   be read, the error is reported and nothing is written.
/// - Databases are shared per path through the DBManager.
/////////////////////////////////////////////////////////////////////////////
class Storage : public ::kvorm::Storage
{
  public:
    Storage(const std::filesystem::path& path, Options options = {});
    ~Storage();

    Storage(const Storage&) = delete;
    Storage(Storage&&) = delete;
    Storage& operator = (const Storage&) = delete;
    Storage& operator = (Storage&&) = delete;

    bool supports_partial_updates() const override        { return true; }
    bool supports_composite_primary_keys() const override { return true; }
    bool requires_composite_primary_keys() const override { return false; }

    void insert(const String& storage_name, const Identifier& id, const Record& data) override;
    void update(const String& storage_name, const Identifier& id, const Record& data) override;
    void remove(const String& storage_name, const Identifier& id) override;
    Record find(const String& storage_name, const Identifier& id) override;

    String name() const override { return "rocksdb"; }

    const std::filesystem::path& path() const { return m_path; }
    bool is_open() const                      { return mp_db != nullptr; }

    static String db_key(const String& storage_name, const Identifier& id);

  private:
    enum class ReadStatus { FOUND, NOT_FOUND, FAILED };

    void open();
    ReadStatus read(const String& key, Record& record);
    void write(::rocksdb::WriteBatch& batch);
    void report_read_error(std::string&& error);
    void report_write_error(std::string&& error);

  private:
    std::filesystem::path m_path;
    Options m_options;
    ::rocksdb::DB* mp_db = nullptr;
};


inline
Storage::Storage(const std::filesystem::path& path, Options options)
  : m_path{path}
  , m_options{options} {
    open();
}

inline
Storage::~Storage() {
    if (mp_db != nullptr) {
        DBManager::get_instance().close(m_path);
        mp_db = nullptr;
    }
}

inline
void Storage::open() {
    ASSERT(mp_db == nullptr);
    auto status = DBManager::get_instance().open(m_options.db, m_path, mp_db);
    if (!status.ok()) {
        mp_db = nullptr;
        report_read_error(status.ToString());
    }
}

inline
String Storage::db_key(const String& storage_name, const Identifier& id) {
    return storage_name + '/' + serialize(id.value());
}

inline
void Storage::report_read_error(std::string&& error) {
    if (m_options.throw_read_error) throw StorageError{std::forward<std::string>(error)};
    if (!m_options.quiet_read) WARN(error);
}

inline
void Storage::report_write_error(std::string&& error) {
    if (m_options.throw_write_error) throw StorageError{std::forward<std::string>(error)};
    if (!m_options.quiet_write) WARN(error);
}

inline
Storage::ReadStatus Storage::read(const String& key, Record& record) {
    if (mp_db == nullptr) {
        report_read_error(fmt::format("Database is not open: {}", m_path.string()));
        return ReadStatus::FAILED;
    }

    std::string data;
    ::rocksdb::Status status = mp_db->Get(m_options.read, key, &data);
    if (status.code() == ::rocksdb::Status::Code::kNotFound)
        return ReadStatus::NOT_FOUND;

    if (!status.ok()) {
        report_read_error(status.ToString());
        return ReadStatus::FAILED;
    }

    record = json::parse_record(data);
    return ReadStatus::FOUND;
}

inline
void Storage::write(::rocksdb::WriteBatch& batch) {
    if (mp_db == nullptr) {
        report_write_error(fmt::format("Database is not open: {}", m_path.string()));
        return;
    }

    ::rocksdb::Status status = mp_db->Write(m_options.write, &batch);
    if (!status.ok()) {
        report_write_error(status.ToString());
    }
}

inline
void Storage::insert(const String& storage_name, const Identifier& id, const Record& data) {
    auto key = db_key(storage_name, id);
    DEBUG("rocksdb insert {}", key);
    ::rocksdb::WriteBatch batch;
    batch.Put(key, Value{data}.to_json());
    write(batch);
}

inline
void Storage::update(const String& storage_name, const Identifier& id, const Record& data) {
    auto key = db_key(storage_name, id);
    DEBUG("rocksdb update {}", key);
    Record record;
    // nothing is written when the stored record cannot be read
    if (read(key, record) == ReadStatus::FAILED) return;
    ::rocksdb::WriteBatch batch;
    batch.Put(key, Value{merge(record, data)}.to_json());
    write(batch);
}

inline
void Storage::remove(const String& storage_name, const Identifier& id) {
    auto key = db_key(storage_name, id);
    DEBUG("rocksdb remove {}", key);
    ::rocksdb::WriteBatch batch;
    batch.Delete(key);
    write(batch);
}

inline
Record Storage::find(const String& storage_name, const Identifier& id) {
    Record record;
    if (read(db_key(storage_name, id), record) != ReadStatus::FOUND) return {};
    return record;
}

} // kvorm::rocksdb namespace
