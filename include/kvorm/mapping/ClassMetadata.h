/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <functional>
#include <memory>
#include <vector>
#include <algorithm>
#include <tsl/ordered_map.h>
#include <fmt/format.h>

#include <kvorm/core/errors.h>
#include <kvorm/support/types.h>

namespace kvorm {

class Entity;

enum class FieldKind
{
    PLAIN,
    EMBEDDED,   // nested object persisted inline, no identity of its own
    TRANSIENT   // never persisted
};

struct FieldMapping
{
    String name;
    FieldKind kind = FieldKind::PLAIN;
    String target;   // target class of an embedded association
    bool is_id = false;
};

/////////////////////////////////////////////////////////////////////////////
/// Mapping descriptor of an entity or embeddable class.
/// - Fields are kept in declaration order. Identifier fields are PLAIN fields
///   flagged with `is_id`, and their declaration order is the order of a
///   composite identifier.
/// - Instances must be owned by a std::shared_ptr, since entities created by
///   `new_instance` keep a reference to their metadata.
/////////////////////////////////////////////////////////////////////////////
class ClassMetadata : public std::enable_shared_from_this<ClassMetadata>
{
  public:
    using Instantiator = std::function<std::shared_ptr<Entity>(std::shared_ptr<const ClassMetadata>)>;
    using FieldMap = tsl::ordered_map<String, FieldMapping>;

    explicit ClassMetadata(const String& name) : m_name{name}, m_storage_name{name} {}

    ClassMetadata(const ClassMetadata&) = delete;
    ClassMetadata& operator = (const ClassMetadata&) = delete;

    const String& name() const         { return m_name; }
    const String& storage_name() const { return m_storage_name; }
    void set_storage_name(const String& storage_name) { m_storage_name = storage_name; }

    bool is_embeddable() const            { return m_embeddable; }
    void set_embeddable(bool embeddable)  { m_embeddable = embeddable; }

    const std::vector<String>& identifier() const { return m_identifier; }
    const FieldMap& fields() const                { return m_fields; }

    void map_identifier(const String& field);
    void map_field(const String& field);
    void map_embedded(const String& field, const String& target_class);
    void skip_transient_field(const String& field);

    bool has_field(const String& field) const { return m_fields.find(field) != m_fields.end(); }
    bool is_identifier(const String& field) const;
    bool is_transient(const String& field) const;
    bool has_association(const String& field) const;
    const String& association_target(const String& field) const;

    void set_instantiator(Instantiator instantiator) { m_instantiator = std::move(instantiator); }

    /// Create a blank instance of the class.
    std::shared_ptr<Entity> new_instance() const;

  private:
    void add_field(FieldMapping&& mapping);

  private:
    String m_name;
    String m_storage_name;
    bool m_embeddable = false;
    std::vector<String> m_identifier;
    FieldMap m_fields;
    Instantiator m_instantiator;
};


inline
void ClassMetadata::add_field(FieldMapping&& mapping) {
    if (has_field(mapping.name))
        throw MappingError(fmt::format("{}::{} is mapped more than once", m_name, mapping.name));
    auto name = mapping.name;
    m_fields.insert({name, std::move(mapping)});
}

inline
void ClassMetadata::map_identifier(const String& field) {
    add_field({field, FieldKind::PLAIN, {}, true});
    m_identifier.push_back(field);
}

inline
void ClassMetadata::map_field(const String& field) {
    add_field({field, FieldKind::PLAIN, {}, false});
}

inline
void ClassMetadata::map_embedded(const String& field, const String& target_class) {
    add_field({field, FieldKind::EMBEDDED, target_class, false});
}

inline
void ClassMetadata::skip_transient_field(const String& field) {
    add_field({field, FieldKind::TRANSIENT, {}, false});
}

inline
bool ClassMetadata::is_identifier(const String& field) const {
    auto it = m_fields.find(field);
    return it != m_fields.end() && it->second.is_id;
}

inline
bool ClassMetadata::is_transient(const String& field) const {
    auto it = m_fields.find(field);
    return it != m_fields.end() && it->second.kind == FieldKind::TRANSIENT;
}

inline
bool ClassMetadata::has_association(const String& field) const {
    auto it = m_fields.find(field);
    return it != m_fields.end() && it->second.kind == FieldKind::EMBEDDED;
}

inline
const String& ClassMetadata::association_target(const String& field) const {
    auto it = m_fields.find(field);
    if (it == m_fields.end() || it->second.kind != FieldKind::EMBEDDED)
        throw MappingError(fmt::format("{}::{} is not an embedded association", m_name, field));
    return it->second.target;
}

} // namespace kvorm

#include <kvorm/core/Entity.h>
