/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Identifier.h>
#include <kvorm/core/Entity.h>
#include <kvorm/core/serialize.h>
#include <kvorm/core/errors.h>
#include <kvorm/mapping/ClassMetadata.h>

#include <fmt/format.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Strategy for reading, normalizing and hashing entity identifiers.
/// - The strategy used by a UnitOfWork is chosen once, from the capability
///   flags Storage::supports_composite_primary_keys and
///   Storage::requires_composite_primary_keys.
/////////////////////////////////////////////////////////////////////////////
class IdHandler
{
  public:
    virtual ~IdHandler() = default;

    /// Returns the canonical identifier for a raw key.
    /// @throws InvalidIdentifier if the key is nil or lacks an identifier field.
    virtual Identifier normalize_id(const ClassMetadata& meta, const Value& raw_key) const = 0;

    /// Read the identifier off a live instance. Empty if any identifier field is unset.
    virtual Identifier get_identifier(const ClassMetadata& meta, const Entity& entity) const = 0;

    /// Write identifier field values onto an instance.
    virtual void set_identifier(const ClassMetadata& meta, Entity& entity, const Identifier& id) const;

    virtual String hash(const Identifier& id) const = 0;

  protected:
    static Value required_field(const ClassMetadata& meta, const Value& raw_key, const String& field);
};

/// Identifiers are the scalar value of the first identifier field.
class SingleIdHandler : public IdHandler
{
  public:
    Identifier normalize_id(const ClassMetadata& meta, const Value& raw_key) const override;
    Identifier get_identifier(const ClassMetadata& meta, const Entity& entity) const override;
    String hash(const Identifier& id) const override;
};

/// Identifiers are ordered records of all identifier fields.
/// - The hash joins the tagged parts with `separator`. Within a part, '#' and
///   '\' are escaped with '\', so the separator never occurs inside a part.
class CompositeIdHandler : public IdHandler
{
  public:
    static constexpr auto separator = "__##__";

    /// @param require_records Reject scalar raw keys, even for a single identifier field.
    explicit CompositeIdHandler(bool require_records = false) : m_require_records{require_records} {}

    Identifier normalize_id(const ClassMetadata& meta, const Value& raw_key) const override;
    Identifier get_identifier(const ClassMetadata& meta, const Entity& entity) const override;
    String hash(const Identifier& id) const override;

  private:
    static String escape(const String& part);

  private:
    bool m_require_records;
};


inline
Value IdHandler::required_field(const ClassMetadata& meta, const Value& raw_key, const String& field) {
    auto value = raw_key.get(field);
    if (value.is_nil())
        throw InvalidIdentifier(fmt::format("{} identifier is missing field '{}': {}", meta.name(), field, raw_key.to_json()));
    return value;
}

inline
void IdHandler::set_identifier(const ClassMetadata& meta, Entity& entity, const Identifier& id) const {
    auto& fields = meta.identifier();
    if (id.is_empty() || fields.empty()) return;

    if (id.is_composite()) {
        for (auto& field : fields) {
            auto value = id.value().get(field);
            if (!value.is_nil()) entity.set(field, value);
        }
    } else {
        entity.set(fields.front(), id.value());
    }
}

inline
Identifier SingleIdHandler::normalize_id(const ClassMetadata& meta, const Value& raw_key) const {
    if (raw_key.is_nil())
        throw InvalidIdentifier(fmt::format("{} identifier is nil", meta.name()));

    if (!raw_key.is_map()) return Identifier{raw_key};

    auto& fields = meta.identifier();
    if (fields.empty())
        throw InvalidIdentifier(fmt::format("{} declares no identifier field", meta.name()));
    return Identifier{required_field(meta, raw_key, fields.front())};
}

inline
Identifier SingleIdHandler::get_identifier(const ClassMetadata& meta, const Entity& entity) const {
    auto& fields = meta.identifier();
    if (fields.empty()) return {};
    return Identifier{entity.get(fields.front())};
}

inline
String SingleIdHandler::hash(const Identifier& id) const {
    return serialize(id.first());
}

inline
Identifier CompositeIdHandler::normalize_id(const ClassMetadata& meta, const Value& raw_key) const {
    if (raw_key.is_nil())
        throw InvalidIdentifier(fmt::format("{} identifier is nil", meta.name()));

    auto& fields = meta.identifier();
    Record id;

    if (!raw_key.is_map()) {
        if (m_require_records)
            throw InvalidIdentifier(fmt::format("{} requires a composite identifier, got {}", meta.name(), raw_key.to_str()));
        if (fields.size() != 1)
            throw InvalidIdentifier(fmt::format("{} requires a composite identifier with {} fields, got {}",
                                                meta.name(), fields.size(), raw_key.to_str()));
        id.insert({fields.front(), raw_key});
        return Identifier{std::move(id)};
    }

    for (auto& field : fields)
        id.insert({field, required_field(meta, raw_key, field)});
    return Identifier{std::move(id)};
}

inline
Identifier CompositeIdHandler::get_identifier(const ClassMetadata& meta, const Entity& entity) const {
    Record id;
    for (auto& field : meta.identifier()) {
        auto value = entity.get(field);
        if (value.is_nil()) return {};
        id.insert({field, value});
    }
    return Identifier{std::move(id)};
}

inline
String CompositeIdHandler::escape(const String& part) {
    String result;
    result.reserve(part.size());
    for (auto c : part) {
        if (c == '#' || c == '\\') result.push_back('\\');
        result.push_back(c);
    }
    return result;
}

inline
String CompositeIdHandler::hash(const Identifier& id) const {
    if (!id.is_composite()) return serialize(id.value());

    String result;
    bool first = true;
    for (auto& [field, value] : id.fields()) {
        if (!first) result += separator;
        first = false;
        result += escape(serialize(value));
    }
    return result;
}

} // namespace kvorm
