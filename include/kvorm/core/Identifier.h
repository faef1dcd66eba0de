/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// The identity of an entity.
/// - An Identifier is either empty (no identity assigned yet), a scalar
///   Value, or a composite Record of identifier field name to value, kept in
///   the declared identifier field order.
/// - The normalized form is produced by an IdHandler and used for identity
///   map lookups. The serialized form is produced by an IdConverter and
///   passed to the storage driver.
/////////////////////////////////////////////////////////////////////////////
class Identifier
{
  public:
    Identifier() = default;
    Identifier(const Value& value) : m_value{value} {}
    Identifier(const Record& fields) : m_value{fields} {}
    Identifier(Record&& fields) : m_value{std::move(fields)} {}

    bool is_empty() const     { return m_value.is_nil() || (m_value.is_map() && m_value.size() == 0); }
    bool is_composite() const { return m_value.is_map(); }

    /// The scalar value, or the composite as a map Value.
    const Value& value() const { return m_value; }

    /// The fields of a composite identifier.
    const Record& fields() const { return m_value.as_map(); }

    /// The scalar value, or the first field value of a composite.
    Value first() const {
        if (!is_composite()) return m_value;
        auto& fields = m_value.as_map();
        return fields.empty()? Value{}: fields.cbegin()->second;
    }

    bool operator == (const Identifier& other) const { return m_value == other.m_value; }

    String to_str() const { return m_value.to_str(); }

  private:
    Value m_value;
};

inline
std::ostream& operator<< (std::ostream& ostream, const Identifier& id) {
    return ostream << id.to_str();
}

} // namespace kvorm
