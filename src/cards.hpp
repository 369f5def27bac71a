#pragma once

#include <string>
#include <string_view>

#include "random.hpp"

namespace txngen
{
    /**
     * How a card number gets its check digit.
     *
     * Strict builds the payload to exactly `length - 1` digits, so the last digit
     * is always the Luhn check digit.
     *
     * Legacy pads the prefix to 15 digits, appends the check digit and only then
     * cuts the number down to `length`. 16 digit numbers come out valid, but a 15
     * digit number loses its check digit to the cut. It's kept so older datasets
     * can be reproduced.
     */
    enum class ChecksumMode
    {
        Strict,
        Legacy
    };

    namespace cards
    {
        constexpr unsigned int LEGACY_PADDED_LENGTH = 15;

        bool is_digits(const std::string_view& str);

        /**
         * Computes the digit that makes `payload + digit` pass the Luhn check.
         * The rightmost payload digit is doubled, then every other digit moving left.
         *
         * @throws std::invalid_argument if the payload is empty or has anything but digits
         */
        unsigned int luhn_check_digit(const std::string_view& payload);

        bool luhn_valid(const std::string_view& number);

        /**
         * Generates a card number that starts with `prefix` and is exactly `length` digits long.
         *
         * @throws std::invalid_argument if the prefix isn't digits or isn't shorter than `length`
         */
        std::string card_number(rng::Engine& gen, const std::string_view& prefix, unsigned int length,
                ChecksumMode mode = ChecksumMode::Strict);

        std::string security_code(rng::Engine& gen, unsigned int length);
    }
}
