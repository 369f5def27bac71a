#include "validation.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <optional>
#include <regex>
#include <sstream>

#include "cards.hpp"

namespace
{
    std::optional<unsigned int> parse_uint(const std::string_view& str)
    {
        if (!txngen::cards::is_digits(str))
            return {};

        unsigned int value;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec != std::errc{} || ptr != str.data() + str.size())
            return {};
        return value;
    }

    std::vector<std::string_view> split(const std::string_view& s, char delimiter)
    {
        std::vector<std::string_view> tokens;
        size_t last = 0;
        size_t next;
        while ((next = s.find(delimiter, last)) != std::string_view::npos)
        {
            tokens.push_back(s.substr(last, next - last));
            last = next + 1;
        }
        tokens.push_back(s.substr(last));
        return tokens;
    }

    template<typename T>
    bool contains(const std::vector<T>& values, const std::string_view& value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

    bool has_at_most_two_decimals(double amount)
    {
        double cents = amount * 100.0;
        return std::abs(cents - std::round(cents)) < 1e-6;
    }

    void check_card(const txngen::Transaction& tx, const txngen::ReferenceTables& tables, bool require_luhn, std::vector<std::string>& errors)
    {
        const auto* brand = txngen::find_brand(tables, tx.card_brand);
        if (!brand)
        {
            errors.emplace_back("unknown card brand '" + tx.card_brand + "'");
            return;
        }

        const auto& number = tx.card_number;
        if (!txngen::cards::is_digits(number))
            errors.emplace_back("card number '" + number + "' is not all digits");

        if (std::find(brand->lengths.begin(), brand->lengths.end(), number.size()) == brand->lengths.end())
            errors.emplace_back("card number length " + std::to_string(number.size()) + " is not valid for " + brand->name);

        bool prefix_ok = std::any_of(brand->prefixes.begin(), brand->prefixes.end(),
                [&number](const auto& prefix) { return number.compare(0, prefix.size(), prefix) == 0; });
        if (!prefix_ok)
            errors.emplace_back("card number '" + number + "' does not start with a " + brand->name + " prefix");

        if (require_luhn && !txngen::cards::luhn_valid(number))
            errors.emplace_back("card number '" + number + "' fails the Luhn check");

        if (tx.cvv.size() != brand->cvv_length || !txngen::cards::is_digits(tx.cvv))
            errors.emplace_back("cvv '" + tx.cvv + "' should be " + std::to_string(brand->cvv_length) + " digits");

        auto expiry = split(tx.card_expiry, '/');
        auto month = expiry.size() == 2 && expiry[0].size() == 2 ? parse_uint(expiry[0]) : std::nullopt;
        auto year = expiry.size() == 2 && expiry[1].size() == 2 ? parse_uint(expiry[1]) : std::nullopt;
        if (!month || !year || *month < 1 || *month > 12)
            errors.emplace_back("card expiry '" + tx.card_expiry + "' is not MM/YY");
    }

    void check_amount(const txngen::Transaction& tx, const txngen::ReferenceTables& tables, std::vector<std::string>& errors)
    {
        if (!contains(tables.currencies, tx.currency))
        {
            errors.emplace_back("unknown currency '" + tx.currency + "'");
            return;
        }

        std::ostringstream amount;
        amount << tx.amount;

        if (tx.currency == "JPY")
        {
            if (tx.amount != std::floor(tx.amount) || tx.amount < 100 || tx.amount > 50000)
                errors.emplace_back("JPY amount " + amount.str() + " is not a whole number in [100, 50000]");
        }
        else if (tx.amount < 1 || tx.amount >= 1001 || !has_at_most_two_decimals(tx.amount))
        {
            errors.emplace_back(tx.currency + " amount " + amount.str() + " is not in [1, 1001) with two decimals");
        }
    }

    void check_network(const txngen::Transaction& tx, std::vector<std::string>& errors)
    {
        auto octets = split(tx.ip_address, '.');
        bool ip_ok = octets.size() == 4;
        for (size_t i = 0; ip_ok && i < octets.size(); ++i)
        {
            auto value = parse_uint(octets[i]);
            ip_ok = value && *value <= 254 && (i != 0 || *value >= 1);
        }
        if (!ip_ok)
            errors.emplace_back("ip address '" + tx.ip_address + "' is out of range");

        auto device = tx.device_id.size() == 8 && tx.device_id.compare(0, 3, "DEV") == 0
                ? parse_uint(std::string_view{tx.device_id}.substr(3))
                : std::nullopt;
        if (!device || *device < 10000 || *device > 99999)
            errors.emplace_back("device id '" + tx.device_id + "' is not DEV followed by 5 digits");
    }
}

std::vector<std::string> txngen::validation::validate(const Transaction& tx, const ReferenceTables& tables, bool require_luhn)
{
    static const std::regex timestamp_pattern{R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}\+00:00$)"};

    std::vector<std::string> errors;

    const auto prefix_length = TRANSACTION_ID_PREFIX.size();
    bool id_ok = tx.transaction_id.size() == prefix_length + TRANSACTION_ID_LENGTH
            && tx.transaction_id.compare(0, prefix_length, TRANSACTION_ID_PREFIX) == 0
            && tx.transaction_id.find_first_not_of(TRANSACTION_ID_ALPHABET, prefix_length) == std::string::npos;
    if (!id_ok)
        errors.emplace_back("transaction id '" + tx.transaction_id + "' is malformed");

    if (!std::regex_match(tx.transaction_date, timestamp_pattern))
        errors.emplace_back("transaction date '" + tx.transaction_date + "' is not ISO-8601");

    if (tx.status == TransactionStatus::Declined && !tx.decline_reason)
        errors.emplace_back("declined transaction has no decline reason");
    else if (tx.status != TransactionStatus::Declined && tx.decline_reason)
        errors.emplace_back(std::string{to_string(tx.status)} + " transaction has a decline reason");

    auto space = tx.cardholder_name.find(' ');
    if (space == std::string::npos
        || !contains(tables.first_names, std::string_view{tx.cardholder_name}.substr(0, space))
        || !contains(tables.last_names, std::string_view{tx.cardholder_name}.substr(space + 1)))
        errors.emplace_back("cardholder name '" + tx.cardholder_name + "' is not from the name tables");

    check_card(tx, tables, require_luhn, errors);
    check_amount(tx, tables, errors);

    const auto* merchant = find_merchant(tables, tx.merchant_id);
    if (!merchant || merchant->name != tx.merchant_name || merchant->category != tx.merchant_category)
        errors.emplace_back("merchant '" + tx.merchant_id + "' does not match the merchant table");

    if (tx.payment_method != PAYMENT_METHOD)
        errors.emplace_back("payment method '" + tx.payment_method + "' is not " + std::string{PAYMENT_METHOD});

    check_network(tx, errors);

    if (!contains(tables.user_agents, tx.user_agent))
        errors.emplace_back("user agent '" + tx.user_agent + "' is not from the user agent table");

    return errors;
}

bool txngen::validation::equivalent(const Transaction& lhs, const Transaction& rhs)
{
    return lhs.transaction_id == rhs.transaction_id
        && lhs.transaction_date == rhs.transaction_date
        && lhs.status == rhs.status
        && lhs.decline_reason == rhs.decline_reason
        && lhs.cardholder_name == rhs.cardholder_name
        && lhs.card_number == rhs.card_number
        && lhs.card_brand == rhs.card_brand
        && lhs.card_expiry == rhs.card_expiry
        && lhs.cvv == rhs.cvv
        && std::llround(lhs.amount * 100.0) == std::llround(rhs.amount * 100.0)
        && lhs.currency == rhs.currency
        && lhs.merchant_name == rhs.merchant_name
        && lhs.merchant_id == rhs.merchant_id
        && lhs.merchant_category == rhs.merchant_category
        && lhs.payment_method == rhs.payment_method
        && lhs.ip_address == rhs.ip_address
        && lhs.device_id == rhs.device_id
        && lhs.user_agent == rhs.user_agent;
}
