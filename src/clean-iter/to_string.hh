#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/pair.hh>
#include <clean-iter/utility.hh>

#include <concepts>
#include <string>
#include <string_view>

// Text form of a single element, used by make_string / append_string
//
// Lookup order for an element v (see impl::element_to_string):
//   - to_string(v), found among the overloads below or by ADL in the namespace of v
//   - v.to_string()
// Element types with neither are rejected at compile time.

namespace ci
{
// in hex
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// 0xFF
[[nodiscard]] std::string to_string(byte b);

// simply the char
[[nodiscard]] std::string to_string(char c);

// integer types
// note: does not use the sized versions because this style is _complete_ for users
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// float/double, shortest round-trip form
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string s);
[[nodiscard]] std::string to_string(std::string_view s);

// (first, second)
template <class T, class U>
[[nodiscard]] std::string to_string(pair<T, U> const& p);

// the value, or "nullopt"
template <class T>
[[nodiscard]] std::string to_string(optional<T> const& v);

namespace impl
{
template <class T>
[[nodiscard]] std::string element_to_string(T const& v)
{
    using ci::to_string;
    if constexpr (requires { { to_string(v) } -> std::convertible_to<std::string>; })
        return to_string(v);
    else if constexpr (requires { { v.to_string() } -> std::convertible_to<std::string>; })
        return v.to_string();
    else
        static_assert(always_false_t<T>, "element type needs a to_string(T) overload or a to_string() member");
}
} // namespace impl

} // namespace ci

//
// Implementation
//

template <class T, class U>
std::string ci::to_string(pair<T, U> const& p)
{
    return "(" + impl::element_to_string(p.first) + ", " + impl::element_to_string(p.second) + ")";
}

template <class T>
std::string ci::to_string(optional<T> const& v)
{
    if (!v.has_value())
        return "nullopt";
    return impl::element_to_string(v.value());
}
