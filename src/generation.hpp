#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

#include "cards.hpp"
#include "models.hpp"
#include "random.hpp"
#include "tables.hpp"

namespace txngen::generation
{
    using Clock = std::chrono::system_clock;
    using Engine = rng::Engine;

    constexpr int64_t MAX_BATCH_SIZE = 1000000;
    constexpr int DATE_WINDOW_DAYS = 365 * 3;

    /**
     * The state a batch is drawn from: one engine, and the instant dates and
     * expiries are measured against.
     */
    struct Context
    {
        Engine engine;
        Clock::time_point now;
        ChecksumMode checksum_mode;

        explicit Context(uint64_t seed, ChecksumMode mode = ChecksumMode::Strict, Clock::time_point now = Clock::now())
            : engine(seed), now(now), checksum_mode(mode) {}
    };

    std::string transaction_id(Engine& gen);
    std::string ip_address(Engine& gen);
    std::string device_id(Engine& gen);

    /**
     * A timestamp up to three years before `now`, as ISO-8601 with a +00:00 offset.
     */
    std::string transaction_date(Engine& gen, Clock::time_point now);
    CardExpiry expiry_date(Engine& gen, Clock::time_point now);

    std::string card_number(Engine& gen, const CardBrand& brand, ChecksumMode mode = ChecksumMode::Strict);
    double amount(Engine& gen, const std::string_view& currency);

    TransactionStatus status(Engine& gen);
    std::optional<DeclineReason> decline_reason(Engine& gen, TransactionStatus status);

    std::string format_timestamp(Clock::time_point time);

    Transaction generate_transaction(Context& context, const ReferenceTables& tables = default_tables());

    /**
     * Generates `count` independent transactions.
     *
     * @throws std::invalid_argument if count is negative or larger than MAX_BATCH_SIZE
     */
    std::vector<Transaction> generate_transactions(int64_t count, Context& context, const ReferenceTables& tables = default_tables());
}
