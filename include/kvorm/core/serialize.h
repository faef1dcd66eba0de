/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>
#include <kvorm/support/string.h>
#include <kvorm/parser/json.h>

namespace kvorm {

/// Type-tagged string encoding of a Value.
/// The first character identifies the type, so values of different types never
/// encode identically: `serialize(1) == "31"`, `serialize(1UL) == "41"`,
/// `serialize(1.0) == "51.0"`, `serialize("1") == "61"`.
inline
std::string serialize(const Value& value) {
    switch (value.type()) {
        case Value::NIL:   return "0";
        case Value::BOOL:  return value.as_bool()? "2": "1";
        case Value::INT:   return '3' + value.to_str();
        case Value::UINT:  return '4' + value.to_str();
        case Value::FLOAT: return '5' + value.to_str();
        case Value::STR:   return '6' + value.as_str();
        case Value::MAP:   return '7' + value.to_json();
        default:           throw Value::wrong_type(value.type());
    }
}

inline
bool deserialize(const std::string_view& data, Value& value) {
    if (data.size() < 1) return false;
    switch (data[0]) {
        case '0': value = nil; break;
        case '1': value = false; break;
        case '2': value = true; break;
        case '3': value = str_to_int(data.substr(1)); break;
        case '4': value = str_to_uint(data.substr(1)); break;
        case '5': value = str_to_float(data.substr(1)); break;
        case '6': value = data.substr(1); break;
        case '7': value = json::parse(data.substr(1)); break;
        default:  return false;
    }
    return true;
}

}  // kvorm namespace
