#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace txngen
{
    /**
     * A card issuing scheme. Every prefix is shorter than every length.
     */
    struct CardBrand
    {
        std::string name;
        std::vector<std::string> prefixes;
        std::vector<unsigned int> lengths;
        unsigned int cvv_length;
    };

    struct Merchant
    {
        std::string name;
        std::string id;
        std::string category;
    };

    struct CardExpiry
    {
        uint8_t month;
        uint16_t year;

        /**
         * @return The expiry as MM/YY
         */
        std::string to_string() const;
    };

    enum class TransactionStatus : uint8_t
    {
        Approved,
        Declined,
        Pending,
        Refunded
    };

    enum class DeclineReason : uint8_t
    {
        InsufficientFunds,
        CardExpired,
        InvalidCard,
        SuspiciousActivity
    };

    constexpr std::array<TransactionStatus, 4> TRANSACTION_STATUSES {
        TransactionStatus::Approved,
        TransactionStatus::Declined,
        TransactionStatus::Pending,
        TransactionStatus::Refunded
    };

    constexpr std::array<DeclineReason, 4> DECLINE_REASONS {
        DeclineReason::InsufficientFunds,
        DeclineReason::CardExpired,
        DeclineReason::InvalidCard,
        DeclineReason::SuspiciousActivity
    };

    constexpr std::string_view PAYMENT_METHOD = "credit_card";

    constexpr std::string_view TRANSACTION_ID_PREFIX = "TXN";
    constexpr std::string_view TRANSACTION_ID_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    constexpr size_t TRANSACTION_ID_LENGTH = 9;

    /**
     * Column names of the CSV header, and keys of every JSON object, in output order.
     */
    constexpr std::array<std::string_view, 18> FIELD_NAMES {
        "transaction_id",
        "transaction_date",
        "status",
        "decline_reason",
        "cardholder_name",
        "card_number",
        "card_brand",
        "card_expiry",
        "cvv",
        "amount",
        "currency",
        "merchant_name",
        "merchant_id",
        "merchant_category",
        "payment_method",
        "ip_address",
        "device_id",
        "user_agent"
    };

    struct Transaction
    {
        std::string transaction_id;
        std::string transaction_date;
        TransactionStatus status;
        std::optional<DeclineReason> decline_reason;
        std::string cardholder_name;
        std::string card_number;
        std::string card_brand;
        std::string card_expiry;
        std::string cvv;
        double amount;
        std::string currency;
        std::string merchant_name;
        std::string merchant_id;
        std::string merchant_category;
        std::string payment_method;
        std::string ip_address;
        std::string device_id;
        std::string user_agent;
    };

    std::string_view to_string(TransactionStatus status);
    std::string_view to_string(DeclineReason reason);

    std::optional<TransactionStatus> status_from_string(const std::string_view& str);
    std::optional<DeclineReason> decline_reason_from_string(const std::string_view& str);
}
