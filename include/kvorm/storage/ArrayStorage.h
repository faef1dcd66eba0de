/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <tsl/ordered_map.h>

#include <kvorm/storage/Storage.h>
#include <kvorm/core/serialize.h>
#include <kvorm/support/logging.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// In-memory storage.
/// - Records are keyed by storage name and the tagged encoding of the
///   identifier, so `1` and `"1"` are distinct keys.
/// - `update` replaces the whole record.
/////////////////////////////////////////////////////////////////////////////
class ArrayStorage : public Storage
{
  public:
    using Table = tsl::ordered_map<String, Record>;

    bool supports_partial_updates() const override        { return false; }
    bool supports_composite_primary_keys() const override { return true; }
    bool requires_composite_primary_keys() const override { return false; }

    void insert(const String& storage_name, const Identifier& id, const Record& data) override;
    void update(const String& storage_name, const Identifier& id, const Record& data) override;
    void remove(const String& storage_name, const Identifier& id) override;
    Record find(const String& storage_name, const Identifier& id) override;

    String name() const override { return "array"; }

    /// Number of records held for a storage name.
    size_t size(const String& storage_name) const;

  private:
    static String key(const Identifier& id) { return serialize(id.value()); }

  private:
    tsl::ordered_map<String, Table> m_data;
};


inline
void ArrayStorage::insert(const String& storage_name, const Identifier& id, const Record& data) {
    DEBUG("array insert {} {}", storage_name, id.to_str());
    m_data[storage_name][key(id)] = data;
}

inline
void ArrayStorage::update(const String& storage_name, const Identifier& id, const Record& data) {
    DEBUG("array update {} {}", storage_name, id.to_str());
    m_data[storage_name][key(id)] = data;
}

inline
void ArrayStorage::remove(const String& storage_name, const Identifier& id) {
    DEBUG("array remove {} {}", storage_name, id.to_str());
    auto it = m_data.find(storage_name);
    if (it == m_data.end()) return;
    it.value().erase(key(id));
}

inline
Record ArrayStorage::find(const String& storage_name, const Identifier& id) {
    auto t_it = m_data.find(storage_name);
    if (t_it == m_data.end()) return {};
    auto r_it = t_it->second.find(key(id));
    return r_it == t_it->second.end()? Record{}: r_it->second;
}

inline
size_t ArrayStorage::size(const String& storage_name) const {
    auto it = m_data.find(storage_name);
    return it == m_data.end()? 0: it->second.size();
}

} // namespace kvorm
