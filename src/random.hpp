#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

/**
 * Draws from an engine the caller owns, so seeding the engine fixes every value
 * drawn from it.
 */
namespace txngen::rng
{
    using Engine = std::mt19937_64;

    template<typename T, typename std::enable_if<std::is_floating_point<T>::value, T>::type* = nullptr>
    inline T number_in_range(Engine& gen, T min, T max)
    {
        std::uniform_real_distribution<T> dist{min, max};
        return dist(gen);
    }

    template<typename T, typename std::enable_if<std::numeric_limits<T>::is_integer, T>::type* = nullptr>
    inline T number_in_range(Engine& gen, T min, T max)
    {
        std::uniform_int_distribution<T> dist{min, max};
        return dist(gen);
    }

    /**
     * A real number in [0, 1)
     */
    inline double unit(Engine& gen)
    {
        std::uniform_real_distribution<double> dist{0.0, 1.0};
        return dist(gen);
    }

    inline char digit(Engine& gen)
    {
        return static_cast<char>('0' + number_in_range(gen, 0, 9));
    }

    template<typename T>
    inline const T& pick(Engine& gen, const T* const values, size_t size)
    {
        if (size == 0)
            throw std::out_of_range("cannot pick from an empty table");

        return values[number_in_range(gen, size_t(0), size - 1)];
    }

    template<typename T>
    inline const T& pick(Engine& gen, const std::vector<T>& values)
    {
        return pick(gen, values.data(), values.size());
    }

    template<typename T, size_t N>
    inline const T& pick(Engine& gen, const std::array<T, N>& values)
    {
        return pick(gen, values.data(), N);
    }

    inline std::string random_string(Engine& gen, const std::string_view& alphabet, size_t length)
    {
        std::string output;
        output.reserve(length);
        for (size_t i = 0; i < length; ++i)
            output += pick(gen, alphabet.data(), alphabet.size());
        return output;
    }

    inline std::string random_digits(Engine& gen, size_t length)
    {
        std::string output;
        output.reserve(length);
        for (size_t i = 0; i < length; ++i)
            output += digit(gen);
        return output;
    }
}
