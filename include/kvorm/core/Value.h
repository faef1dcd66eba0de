/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <string>
#include <string_view>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <tsl/ordered_map.h>

#include <kvorm/support/types.h>
#include <kvorm/support/string.h>
#include <kvorm/support/exception.h>

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;

namespace kvorm {

class Value;

/// Insertion-ordered field/value mapping used for records, snapshots and change sets.
using Record = tsl::ordered_map<String, Value>;

struct WrongType : public KvormException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : KvormException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected)
      : KvormException(make_message(actual, expected)) {}
};

/////////////////////////////////////////////////////////////////////////////
/// A dynamically typed field value.
/// - A Value holds one of the following data types:
///     - nil
///     - boolean
///     - integer          (64-bit, see kvorm/support/types.h)
///     - unsigned integer (64-bit)
///     - floating point   (64-bit)
///     - string
///     - map              (an insertion-ordered Record)
/// - Equality is strict. Values of different types are never equal, so
///   `Value{1} != Value{1UL}` and `Value{1} != Value{1.0}`. Maps are equal
///   when they hold the same keys, in the same order, with equal values.
/// - Strings and maps are owned and deep-copied.
/////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    enum ReprIX {
        NIL,   // json null, also used for unset fields
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        MAP
    };

  private:
    union Repr {
        Repr()          : z{nullptr} {}
        Repr(bool v)    : b{v} {}
        Repr(Int v)     : i{v} {}
        Repr(UInt v)    : u{v} {}
        Repr(Float v)   : f{v} {}
        Repr(String* p) : ps{p} {}
        Repr(Record* p) : pm{p} {}

        void*   z;
        bool    b;
        Int     i;
        UInt    u;
        Float   f;
        String* ps;
        Record* pm;
    };

  public:
    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case NIL:   return "nil";
            case BOOL:  return "bool";
            case INT:   return "int";
            case UINT:  return "uint";
            case FLOAT: return "float";
            case STR:   return "string";
            case MAP:   return "map";
            default:    throw std::logic_error("invalid repr_ix");
        }
    }

  public:
    Value()                       : m_repr{}, m_repr_ix{NIL} {}
    Value(nil_t)                  : m_repr{}, m_repr_ix{NIL} {}
    Value(is_bool auto v)         : m_repr{v}, m_repr_ix{BOOL} {}
    Value(is_like_Int auto v)     : m_repr{(Int)v}, m_repr_ix{INT} {}
    Value(is_like_UInt auto v)    : m_repr{(UInt)v}, m_repr_ix{UINT} {}
    Value(is_like_Float auto v)   : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Value(const char* s)          : m_repr{new String{s}}, m_repr_ix{STR} {}
    Value(const String& s)        : m_repr{new String{s}}, m_repr_ix{STR} {}
    Value(const StringView& s)    : m_repr{new String{s}}, m_repr_ix{STR} {}
    Value(String&& s)             : m_repr{new String{std::move(s)}}, m_repr_ix{STR} {}
    Value(const Record& map)      : m_repr{new Record{map}}, m_repr_ix{MAP} {}
    Value(Record&& map)           : m_repr{new Record{std::move(map)}}, m_repr_ix{MAP} {}
    Value(ReprIX type);

    Value(const Value& other);
    Value(Value&& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
        other.m_repr.z = nullptr;
        other.m_repr_ix = NIL;
    }

    ~Value() { release(); }

    Value& operator = (const Value& other) {
        if (this != &other) {
            Value copy{other};
            swap(copy);
        }
        return *this;
    }

    Value& operator = (Value&& other) {
        if (this != &other) {
            release();
            m_repr = other.m_repr;
            m_repr_ix = other.m_repr_ix;
            other.m_repr.z = nullptr;
            other.m_repr_ix = NIL;
        }
        return *this;
    }

    void swap(Value& other) {
        std::swap(m_repr, other.m_repr);
        std::swap(m_repr_ix, other.m_repr_ix);
    }

    bool operator == (nil_t) const { return m_repr_ix == NIL; }
    bool operator == (const Value& other) const;

    ReprIX type() const    { return m_repr_ix; }
    auto type_name() const { return type_name(m_repr_ix); }

    bool is_nil() const     { return m_repr_ix == NIL; }
    bool is_map() const     { return m_repr_ix == MAP; }
    bool is_str() const     { return m_repr_ix == STR; }
    bool is_any_int() const { return m_repr_ix == INT || m_repr_ix == UINT; }
    bool is_scalar() const  { return m_repr_ix != NIL && m_repr_ix != MAP; }

    bool as_bool() const          { check(BOOL); return m_repr.b; }
    Int as_int() const            { check(INT); return m_repr.i; }
    UInt as_uint() const          { check(UINT); return m_repr.u; }
    Float as_float() const        { check(FLOAT); return m_repr.f; }
    const String& as_str() const  { check(STR); return *m_repr.ps; }
    const Record& as_map() const  { check(MAP); return *m_repr.pm; }
    Record& as_map()              { check(MAP); return *m_repr.pm; }

    /// Lookup a key of a map, returning nil if the key is absent.
    Value get(const String& key) const;

    /// Returns true if this is a map containing the key.
    bool contains(const String& key) const;

    /// Number of entries in a map, length of a string, otherwise 0.
    size_t size() const;

    String to_str() const;
    String to_json() const;

    static WrongType wrong_type(ReprIX actual)                  { return type_name(actual); };
    static WrongType wrong_type(ReprIX actual, ReprIX expected) { return {type_name(actual), type_name(expected)}; };

  private:
    void check(ReprIX expected) const {
        if (m_repr_ix != expected) throw wrong_type(m_repr_ix, expected);
    }

    void release();
    void to_json(std::ostream& stream) const;

  private:
    Repr m_repr;
    ReprIX m_repr_ix;

  friend std::ostream& operator<< (std::ostream& ostream, const Value& value);
};


/// Strict, order-sensitive record equality.
inline
bool identical(const Record& lhs, const Record& rhs) {
    if (lhs.size() != rhs.size()) return false;
    auto l_it = lhs.cbegin();
    auto r_it = rhs.cbegin();
    for (; l_it != lhs.cend(); ++l_it, ++r_it) {
        if (l_it->first != r_it->first) return false;
        if (!(l_it->second == r_it->second)) return false;
    }
    return true;
}

inline
Value::Value(ReprIX type) : m_repr{}, m_repr_ix{type} {
    switch (type) {
        case NIL:   break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case UINT:  m_repr.u = 0; break;
        case FLOAT: m_repr.f = 0; break;
        case STR:   m_repr.ps = new String{}; break;
        case MAP:   m_repr.pm = new Record{}; break;
        default:    throw std::logic_error("invalid repr_ix");
    }
}

inline
Value::Value(const Value& other) : m_repr{}, m_repr_ix{other.m_repr_ix} {
    switch (m_repr_ix) {
        case NIL:   break;
        case BOOL:  m_repr.b = other.m_repr.b; break;
        case INT:   m_repr.i = other.m_repr.i; break;
        case UINT:  m_repr.u = other.m_repr.u; break;
        case FLOAT: m_repr.f = other.m_repr.f; break;
        case STR:   m_repr.ps = new String{*other.m_repr.ps}; break;
        case MAP:   m_repr.pm = new Record{*other.m_repr.pm}; break;
    }
}

inline
void Value::release() {
    switch (m_repr_ix) {
        case STR: delete m_repr.ps; break;
        case MAP: delete m_repr.pm; break;
        default:  break;
    }
    m_repr.z = nullptr;
    m_repr_ix = NIL;
}

inline
bool Value::operator == (const Value& other) const {
    if (m_repr_ix != other.m_repr_ix) return false;
    switch (m_repr_ix) {
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case UINT:  return m_repr.u == other.m_repr.u;
        case FLOAT: return m_repr.f == other.m_repr.f;
        case STR:   return *m_repr.ps == *other.m_repr.ps;
        case MAP:   return identical(*m_repr.pm, *other.m_repr.pm);
    }
    return false;
}

inline
Value Value::get(const String& key) const {
    if (m_repr_ix != MAP) return nil;
    auto it = m_repr.pm->find(key);
    return it == m_repr.pm->end()? Value{}: it->second;
}

inline
bool Value::contains(const String& key) const {
    return m_repr_ix == MAP && m_repr.pm->find(key) != m_repr.pm->end();
}

inline
size_t Value::size() const {
    switch (m_repr_ix) {
        case STR: return m_repr.ps->size();
        case MAP: return m_repr.pm->size();
        default:  return 0;
    }
}

inline
String Value::to_str() const {
    switch (m_repr_ix) {
        case NIL:   return "nil";
        case BOOL:  return m_repr.b? "true": "false";
        case INT:   return int_to_str(m_repr.i);
        case UINT:  return int_to_str(m_repr.u);
        case FLOAT: return float_to_str(m_repr.f);
        case STR:   return *m_repr.ps;
        case MAP:   return to_json();
    }
    throw wrong_type(m_repr_ix);
}

inline
void Value::to_json(std::ostream& stream) const {
    switch (m_repr_ix) {
        case NIL:   stream << "null"; break;
        case BOOL:  stream << (m_repr.b? "true": "false"); break;
        case INT:   stream << int_to_str(m_repr.i); break;
        case UINT:  stream << int_to_str(m_repr.u); break;
        case FLOAT: stream << float_to_str(m_repr.f); break;
        case STR:   stream << json_quoted(*m_repr.ps); break;
        case MAP: {
            stream << '{';
            bool first = true;
            for (auto& [key, value] : *m_repr.pm) {
                if (!first) stream << ", ";
                first = false;
                stream << json_quoted(key) << ": ";
                value.to_json(stream);
            }
            stream << '}';
            break;
        }
    }
}

inline
String Value::to_json() const {
    StringStream ss;
    to_json(ss);
    return ss.str();
}

inline
std::ostream& operator<< (std::ostream& ostream, const Value& value) {
    return ostream << value.to_str();
}

/// Apply changes onto a copy of base. Existing keys keep their position.
inline
Record merge(const Record& base, const Record& changes) {
    Record result = base;
    for (auto& [key, value] : changes)
        result[key] = value;
    return result;
}

} // namespace kvorm
