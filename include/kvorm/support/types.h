/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>

namespace kvorm {

using Int = int64_t;
using UInt = uint64_t;
using Float = double;
using String = std::string;
using StringView = std::string_view;
using StringStream = std::stringstream;

/// Opaque per-unit-of-work instance handle (0 means unassigned).
using Handle = uint64_t;

struct nil_t {};
constexpr static nil_t nil;

template <typename T>
concept is_bool = std::is_same<T, bool>::value;

template<typename T>
concept is_like_Int = std::is_signed<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, Int>;

template<typename T>
concept is_like_UInt = !is_bool<T> && std::is_unsigned<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, UInt>;

template<typename T>
concept is_like_Float = std::is_floating_point<T>::value;

} // namespace kvorm
