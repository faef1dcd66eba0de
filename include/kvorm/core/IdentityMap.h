/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>
#include <tsl/ordered_map.h>

#include <kvorm/core/Entity.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Registry of live instances by class name and identifier hash.
/// - At most one instance is held per identity.
/// - Iteration follows registration order, per class, in the order classes
///   were first registered.
/////////////////////////////////////////////////////////////////////////////
class IdentityMap
{
  public:
    using EntityMap = tsl::ordered_map<String, std::shared_ptr<Entity>>;
    using ClassMap = tsl::ordered_map<String, EntityMap>;

    std::shared_ptr<Entity> get(const String& class_name, const String& id_hash) const;
    bool contains(const String& class_name, const String& id_hash) const;

    void add(const String& class_name, const String& id_hash, std::shared_ptr<Entity> p_entity);
    bool remove(const String& class_name, const String& id_hash);
    void clear() { m_classes.clear(); }

    size_t size() const;
    size_t size(const String& class_name) const;

    /// Visit every registered instance.
    template <typename Visitor>
    void for_each(Visitor&& visitor) const {
        for (auto& [class_name, entities] : m_classes)
            for (auto& [id_hash, p_entity] : entities)
                visitor(class_name, id_hash, p_entity);
    }

  private:
    ClassMap m_classes;
};


inline
std::shared_ptr<Entity> IdentityMap::get(const String& class_name, const String& id_hash) const {
    auto c_it = m_classes.find(class_name);
    if (c_it == m_classes.end()) return nullptr;
    auto e_it = c_it->second.find(id_hash);
    return e_it == c_it->second.end()? nullptr: e_it->second;
}

inline
bool IdentityMap::contains(const String& class_name, const String& id_hash) const {
    return get(class_name, id_hash) != nullptr;
}

inline
void IdentityMap::add(const String& class_name, const String& id_hash, std::shared_ptr<Entity> p_entity) {
    ASSERT(p_entity != nullptr);
    m_classes[class_name][id_hash] = std::move(p_entity);
}

inline
bool IdentityMap::remove(const String& class_name, const String& id_hash) {
    auto c_it = m_classes.find(class_name);
    if (c_it == m_classes.end()) return false;
    return c_it.value().erase(id_hash) > 0;
}

inline
size_t IdentityMap::size() const {
    size_t count = 0;
    for (auto& [class_name, entities] : m_classes)
        count += entities.size();
    return count;
}

inline
size_t IdentityMap::size(const String& class_name) const {
    auto c_it = m_classes.find(class_name);
    return c_it == m_classes.end()? 0: c_it->second.size();
}

} // namespace kvorm
