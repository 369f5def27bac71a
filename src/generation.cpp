#include "generation.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>


namespace
{
    std::tm utc_calendar(txngen::generation::Clock::time_point time)
    {
        std::time_t t = txngen::generation::Clock::to_time_t(time);
        std::tm tm{};
        gmtime_r(&t, &tm);
        return tm;
    }
}

std::string txngen::generation::transaction_id(Engine& gen)
{
    return std::string{TRANSACTION_ID_PREFIX} + rng::random_string(gen, TRANSACTION_ID_ALPHABET, TRANSACTION_ID_LENGTH);
}

std::string txngen::generation::ip_address(Engine& gen)
{
    std::ostringstream out;
    out << rng::number_in_range(gen, 1, 254) << '.'
        << rng::number_in_range(gen, 0, 254) << '.'
        << rng::number_in_range(gen, 0, 254) << '.'
        << rng::number_in_range(gen, 0, 254);
    return out.str();
}

std::string txngen::generation::device_id(Engine& gen)
{
    return "DEV" + std::to_string(rng::number_in_range(gen, 10000, 99999));
}

std::string txngen::generation::format_timestamp(Clock::time_point time)
{
    auto whole_seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (whole_seconds > time)
        whole_seconds -= std::chrono::seconds(1);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time - whole_seconds).count();

    auto tm = utc_calendar(whole_seconds);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream out;
    out << buf << '.' << std::setfill('0') << std::setw(6) << micros << "+00:00";
    return out.str();
}

std::string txngen::generation::transaction_date(Engine& gen, Clock::time_point now)
{
    auto days_ago = rng::number_in_range(gen, 0, DATE_WINDOW_DAYS - 1);
    return format_timestamp(now - std::chrono::hours(24) * days_ago);
}

txngen::CardExpiry txngen::generation::expiry_date(Engine& gen, Clock::time_point now)
{
    auto current_year = utc_calendar(now).tm_year + 1900;
    auto years_ahead = rng::number_in_range(gen, 1, 5);
    auto month = rng::number_in_range(gen, 1, 12);

    return {
        (uint8_t)month,
        (uint16_t)(current_year + years_ahead)
    };
}

std::string txngen::generation::card_number(Engine& gen, const CardBrand& brand, ChecksumMode mode)
{
    const auto& prefix = rng::pick(gen, brand.prefixes);
    auto length = rng::pick(gen, brand.lengths);
    return cards::card_number(gen, prefix, length, mode);
}

double txngen::generation::amount(Engine& gen, const std::string_view& currency)
{
    if (currency == "JPY")
        return (double)rng::number_in_range(gen, 100, 50000);

    auto whole = rng::number_in_range(gen, 1, 1000);
    // floor keeps the cents in [0, 99], so the total never reaches 1001
    auto cents = std::min(99, (int)std::floor(rng::unit(gen) * 100.0));
    return whole + cents / 100.0;
}

txngen::TransactionStatus txngen::generation::status(Engine& gen)
{
    return rng::pick(gen, TRANSACTION_STATUSES);
}

std::optional<txngen::DeclineReason> txngen::generation::decline_reason(Engine& gen, TransactionStatus status)
{
    if (status != TransactionStatus::Declined)
        return {};

    return rng::pick(gen, DECLINE_REASONS);
}

txngen::Transaction txngen::generation::generate_transaction(Context& context, const ReferenceTables& tables)
{
    auto& gen = context.engine;

    const auto& brand = rng::pick(gen, tables.card_brands);
    const auto& merchant = rng::pick(gen, tables.merchants);
    auto txn_status = status(gen);
    const auto& first_name = rng::pick(gen, tables.first_names);
    const auto& last_name = rng::pick(gen, tables.last_names);
    const auto& currency = rng::pick(gen, tables.currencies);
    const auto& user_agent = rng::pick(gen, tables.user_agents);

    auto number = card_number(gen, brand, context.checksum_mode);
    auto expiry = expiry_date(gen, context.now);
    auto date = transaction_date(gen, context.now);
    auto txn_amount = amount(gen, currency);
    auto reason = decline_reason(gen, txn_status);

    return {
        transaction_id(gen),
        std::move(date),
        txn_status,
        reason,
        first_name + " " + last_name,
        std::move(number),
        brand.name,
        expiry.to_string(),
        cards::security_code(gen, brand.cvv_length),
        txn_amount,
        currency,
        merchant.name,
        merchant.id,
        merchant.category,
        std::string{PAYMENT_METHOD},
        ip_address(gen),
        device_id(gen),
        user_agent
    };
}

std::vector<txngen::Transaction> txngen::generation::generate_transactions(int64_t count, Context& context, const ReferenceTables& tables)
{
    if (count < 0)
        throw std::invalid_argument("transaction count must not be negative, got " + std::to_string(count));
    if (count > MAX_BATCH_SIZE)
        throw std::invalid_argument("transaction count " + std::to_string(count) + " exceeds the limit of " + std::to_string(MAX_BATCH_SIZE));

    std::vector<Transaction> transactions;
    transactions.reserve((size_t)count);
    for (int64_t i = 0; i < count; ++i)
        transactions.emplace_back(generate_transaction(context, tables));
    return transactions;
}
