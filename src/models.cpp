#include "models.hpp"

#include <iomanip>
#include <sstream>

namespace txngen
{
    std::string CardExpiry::to_string() const
    {
        std::ostringstream out;
        out << std::setfill('0')
            << std::setw(2) << (unsigned int)month
            << '/'
            << std::setw(2) << (year % 100);
        return out.str();
    }

    std::string_view to_string(TransactionStatus status)
    {
        switch (status)
        {
        case TransactionStatus::Approved: return "approved";
        case TransactionStatus::Declined: return "declined";
        case TransactionStatus::Pending: return "pending";
        case TransactionStatus::Refunded: return "refunded";
        }
        return "unknown";
    }

    std::string_view to_string(DeclineReason reason)
    {
        switch (reason)
        {
        case DeclineReason::InsufficientFunds: return "insufficient_funds";
        case DeclineReason::CardExpired: return "card_expired";
        case DeclineReason::InvalidCard: return "invalid_card";
        case DeclineReason::SuspiciousActivity: return "suspicious_activity";
        }
        return "unknown";
    }

    std::optional<TransactionStatus> status_from_string(const std::string_view& str)
    {
        for (auto status : TRANSACTION_STATUSES)
            if (to_string(status) == str)
                return status;
        return {};
    }

    std::optional<DeclineReason> decline_reason_from_string(const std::string_view& str)
    {
        for (auto reason : DECLINE_REASONS)
            if (to_string(reason) == str)
                return reason;
        return {};
    }
}
