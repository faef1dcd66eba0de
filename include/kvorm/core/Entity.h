/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>
#include <tsl/ordered_map.h>

#include <kvorm/core/Value.h>
#include <kvorm/core/errors.h>
#include <kvorm/mapping/ClassMetadata.h>

namespace kvorm {

class UnitOfWork;

/////////////////////////////////////////////////////////////////////////////
/// An in-memory instance of a mapped class.
/// - Declared PLAIN and TRANSIENT fields are stored by name.
/// - EMBEDDED associations are stored as nested instances (or null), and are
///   accessed with get_embedded/set_embedded.
/// - Attributes that the class does not declare are kept in a side-mapping of
///   extra attributes, which is folded into snapshots after declared fields.
/// - Applications may derive typed classes from Entity, and register them
///   with ClassMetadata::set_instantiator.
/////////////////////////////////////////////////////////////////////////////
class Entity
{
  public:
    using EmbeddedMap = tsl::ordered_map<String, std::shared_ptr<Entity>>;

    explicit Entity(std::shared_ptr<const ClassMetadata> p_class) : mp_class{std::move(p_class)} {
        ASSERT(mp_class != nullptr);
    }

    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator = (const Entity&) = delete;

    const String& class_name() const       { return mp_class->name(); }
    const ClassMetadata& metadata() const  { return *mp_class; }

    /// Returns the value of a declared field or extra attribute, or nil if unset.
    Value get(const String& name) const;

    /// Assign a declared field, or an extra attribute if the name is not declared.
    void set(const String& name, const Value& value);

    /// Remove the value of a field or extra attribute.
    void unset(const String& name);

    std::shared_ptr<Entity> get_embedded(const String& name) const;
    void set_embedded(const String& name, std::shared_ptr<Entity> p_entity);

    const Record& extras() const { return m_extras; }

  private:
    std::shared_ptr<const ClassMetadata> mp_class;
    Record m_fields;
    Record m_extras;
    EmbeddedMap m_embedded;
    Handle m_handle = 0;
    const UnitOfWork* mp_owner = nullptr;

  friend class UnitOfWork;
};


inline
Value Entity::get(const String& name) const {
    if (mp_class->has_field(name)) {
        if (mp_class->has_association(name))
            throw MappingError(fmt::format("{}::{} is embedded, use get_embedded", class_name(), name));
        auto it = m_fields.find(name);
        return it == m_fields.end()? Value{}: it->second;
    }
    auto it = m_extras.find(name);
    return it == m_extras.end()? Value{}: it->second;
}

inline
void Entity::set(const String& name, const Value& value) {
    if (mp_class->has_field(name)) {
        if (mp_class->has_association(name))
            throw MappingError(fmt::format("{}::{} is embedded, use set_embedded", class_name(), name));
        m_fields[name] = value;
    } else {
        m_extras[name] = value;
    }
}

inline
void Entity::unset(const String& name) {
    if (mp_class->has_association(name)) {
        m_embedded.erase(name);
    } else if (mp_class->has_field(name)) {
        m_fields.erase(name);
    } else {
        m_extras.erase(name);
    }
}

inline
std::shared_ptr<Entity> Entity::get_embedded(const String& name) const {
    if (!mp_class->has_association(name))
        throw MappingError(fmt::format("{}::{} is not an embedded association", class_name(), name));
    auto it = m_embedded.find(name);
    return it == m_embedded.end()? nullptr: it->second;
}

inline
void Entity::set_embedded(const String& name, std::shared_ptr<Entity> p_entity) {
    auto& target = mp_class->association_target(name);
    if (p_entity && p_entity->class_name() != target)
        throw MappingError(fmt::format("{}::{} expects {}, got {}", class_name(), name, target, p_entity->class_name()));
    m_embedded[name] = std::move(p_entity);
}

inline
std::shared_ptr<Entity> ClassMetadata::new_instance() const {
    auto p_class = shared_from_this();
    if (m_instantiator) {
        auto p_entity = m_instantiator(p_class);
        ASSERT(p_entity != nullptr);
        return p_entity;
    }
    return std::make_shared<Entity>(p_class);
}

} // namespace kvorm
