#pragma once

#include <vector>
#include <kvorm/storage/ArrayStorage.h>

namespace kvorm::test {

/// ArrayStorage with configurable capability flags, recording every call.
class RecordingStorage : public ArrayStorage
{
  public:
    struct Call
    {
        String op;
        String storage_name;
        Identifier id;
        Record data;
    };

    RecordingStorage(bool partial_updates, bool composite_keys, bool requires_composite_keys = false)
      : m_partial_updates{partial_updates}
      , m_composite_keys{composite_keys}
      , m_requires_composite_keys{requires_composite_keys} {}

    bool supports_partial_updates() const override        { return m_partial_updates; }
    bool supports_composite_primary_keys() const override { return m_composite_keys; }
    bool requires_composite_primary_keys() const override { return m_requires_composite_keys; }

    void insert(const String& storage_name, const Identifier& id, const Record& data) override {
        calls.push_back({"insert", storage_name, id, data});
        if (fail_on == "insert") throw StorageError("insert failed");
        ArrayStorage::insert(storage_name, id, data);
    }

    void update(const String& storage_name, const Identifier& id, const Record& data) override {
        calls.push_back({"update", storage_name, id, data});
        if (fail_on == "update") throw StorageError("update failed");
        if (m_partial_updates) {
            ArrayStorage::update(storage_name, id, merge(ArrayStorage::find(storage_name, id), data));
        } else {
            ArrayStorage::update(storage_name, id, data);
        }
    }

    void remove(const String& storage_name, const Identifier& id) override {
        calls.push_back({"remove", storage_name, id, {}});
        if (fail_on == "remove") throw StorageError("remove failed");
        ArrayStorage::remove(storage_name, id);
    }

    Record find(const String& storage_name, const Identifier& id) override {
        calls.push_back({"find", storage_name, id, {}});
        return ArrayStorage::find(storage_name, id);
    }

    /// Store a record without recording the call.
    void put(const String& storage_name, const Identifier& id, const Record& data) {
        ArrayStorage::insert(storage_name, id, data);
    }

    size_t count(const String& op) const {
        size_t n = 0;
        for (auto& call : calls)
            if (call.op == op) ++n;
        return n;
    }

    std::vector<Call> calls;
    String fail_on;

  private:
    bool m_partial_updates;
    bool m_composite_keys;
    bool m_requires_composite_keys;
};

} // namespace kvorm::test
