#include "env.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace
{
    constexpr std::array<std::pair<std::string_view, bool>, 8> BOOL_NAMES {{
        {"1", true}, {"true", true}, {"yes", true}, {"on", true},
        {"0", false}, {"false", false}, {"no", false}, {"off", false}
    }};

    template<typename T>
    T parse_integer(const char* name, const std::string& str)
    {
        const char* first = str.data();
        const char* last = str.data() + str.size();
        if (first != last && *first == '+')
            ++first;

        T value{};
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (first == last || ec != std::errc{} || ptr != last)
            throw std::invalid_argument(std::string{name} + " must be a non-negative integer, got '" + str + "'");
        return value;
    }
}

namespace txngen::env
{
    std::optional<std::string> get_string(const char* name)
    {
        const char* x = std::getenv(name);
        if (!x || *x == '\0')
            return {};
        return std::string{x};
    }

    std::string get_string(const char* name, std::string def)
    {
        return get_string(name).value_or(std::move(def));
    }

    std::optional<bool> get_bool(const char* name)
    {
        auto str = get_string(name);
        if (!str)
            return {};

        std::transform(str->begin(), str->end(), str->begin(), [](unsigned char c) { return (char)std::tolower(c); });
        for (const auto& [text, value] : BOOL_NAMES)
            if (*str == text)
                return value;

        throw std::invalid_argument(std::string{name} + " must be a boolean, got '" + *str + "'");
    }

    bool get_bool(const char* name, bool def)
    {
        return get_bool(name).value_or(def);
    }

    std::optional<uint64_t> get_uint(const char* name)
    {
        if (auto str = get_string(name))
            return parse_integer<uint64_t>(name, *str);
        return {};
    }
}
