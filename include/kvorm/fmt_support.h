#pragma once

#include <fmt/format.h>
#include <kvorm/core/Value.h>
#include <kvorm/core/Identifier.h>

namespace fmt {

template <>
struct formatter<kvorm::Value> : formatter<std::string> {
  auto format(const kvorm::Value& value, format_context& ctx) const {
    return formatter<std::string>::format(value.to_str(), ctx);
  }
};

template <>
struct formatter<kvorm::Identifier> : formatter<std::string> {
  auto format(const kvorm::Identifier& id, format_context& ctx) const {
    return formatter<std::string>::format(id.to_str(), ctx);
  }
};

} // namespace fmt
