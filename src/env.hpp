#pragma once

#include <cstdint>
#include <string>
#include <optional>

/**
 * Typed lookups of environment variables. An empty variable counts as unset.
 */
namespace txngen::env
{
    std::optional<std::string> get_string(const char* name);

    /**
     * Accepts 1/0, true/false, yes/no and on/off in any case.
     *
     * @throws std::invalid_argument for any other value
     */
    std::optional<bool> get_bool(const char* name);

    /**
     * @throws std::invalid_argument if the value isn't a base 10 unsigned integer that fits
     */
    std::optional<uint64_t> get_uint(const char* name);

    std::string get_string(const char* name, std::string def);
    bool get_bool(const char* name, bool def);
}
