#include "to_string.hh"

#include <clean-iter/assert.hh>

#include <charconv>
#include <cstdint>
#include <type_traits>

namespace
{
// shortest form that parses back to the same value
template <class T>
std::string chars_of(T value, int base = 10)
{
    char buffer[64];
    std::to_chars_result res;
    if constexpr (std::is_floating_point_v<T>)
        res = std::to_chars(buffer, buffer + sizeof(buffer), value);
    else
        res = std::to_chars(buffer, buffer + sizeof(buffer), value, base);
    CI_ASSERT(res.ec == std::errc(), "buffer is large enough for every arithmetic type");
    return std::string(buffer, res.ptr);
}
} // namespace

std::string ci::to_string(void const* ptr)
{
    return "0x" + chars_of(reinterpret_cast<std::uintptr_t>(ptr), 16);
}

std::string ci::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string ci::to_string(byte b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    auto const v = static_cast<unsigned char>(b);
    return {'0', 'x', digits[v >> 4], digits[v & 0xF]};
}

std::string ci::to_string(char c)
{
    return std::string(1, c);
}

std::string ci::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string ci::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string ci::to_string(signed short i)
{
    return chars_of(i);
}

std::string ci::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string ci::to_string(signed int i)
{
    return chars_of(i);
}

std::string ci::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string ci::to_string(signed long i)
{
    return chars_of(i);
}

std::string ci::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string ci::to_string(signed long long i)
{
    return chars_of(i);
}

std::string ci::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string ci::to_string(float f)
{
    return chars_of(f);
}

std::string ci::to_string(double f)
{
    return chars_of(f);
}

std::string ci::to_string(char const* s)
{
    return {s};
}

std::string ci::to_string(std::string s)
{
    return s;
}

std::string ci::to_string(std::string_view s)
{
    return std::string(s);
}
