#include "cards.hpp"

#include <stdexcept>

bool txngen::cards::is_digits(const std::string_view& str)
{
    if (str.empty())
        return false;

    for (auto c : str)
        if (c < '0' || c > '9')
            return false;
    return true;
}

unsigned int txngen::cards::luhn_check_digit(const std::string_view& payload)
{
    if (!is_digits(payload))
        throw std::invalid_argument("Luhn payload must be a non-empty string of digits");

    unsigned int sum = 0;
    bool double_it = true;
    for (auto it = payload.rbegin(); it != payload.rend(); ++it)
    {
        unsigned int value = *it - '0';
        if (double_it)
        {
            value *= 2;
            if (value > 9)
                value -= 9;
        }
        sum += value;
        double_it = !double_it;
    }

    return (10 - (sum % 10)) % 10;
}

bool txngen::cards::luhn_valid(const std::string_view& number)
{
    if (number.size() < 2 || !is_digits(number))
        return false;

    auto payload = number.substr(0, number.size() - 1);
    return (unsigned int)(number.back() - '0') == luhn_check_digit(payload);
}

std::string txngen::cards::card_number(rng::Engine& gen, const std::string_view& prefix, unsigned int length, ChecksumMode mode)
{
    if (!is_digits(prefix) || prefix.size() >= length)
        throw std::invalid_argument("card prefix must be digits and shorter than the card length");

    std::string result{prefix};
    auto padded_length = mode == ChecksumMode::Strict ? length - 1 : LEGACY_PADDED_LENGTH;

    while (result.size() < padded_length)
        result += rng::digit(gen);

    if (mode == ChecksumMode::Legacy && result.size() > LEGACY_PADDED_LENGTH)
        result.pop_back();

    result += (char)('0' + luhn_check_digit(result));
    return mode == ChecksumMode::Strict ? result : result.substr(0, length);
}

std::string txngen::cards::security_code(rng::Engine& gen, unsigned int length)
{
    return rng::random_digits(gen, length);
}
