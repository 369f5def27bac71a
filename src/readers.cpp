#include "readers.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace
{
    class parse_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    std::string next_field(std::istream& input, char delim)
    {
        std::string field;
        if (!std::getline(input, field, delim))
            throw parse_error("expected " + std::to_string(txngen::FIELD_NAMES.size()) + " fields");
        return field;
    }

    /**
     * Quoted fields may contain the delimiter, so keep pulling pieces until the
     * closing quote shows up, putting the delimiters back in between.
     */
    std::string next_quoted(std::istream& input, char delim)
    {
        std::string result = next_field(input, delim);
        if (result.empty() || result.front() != '"')
            throw parse_error("expected a quoted field, got '" + result + "'");

        while (result.size() < 2 || result.back() != '"')
        {
            std::string piece;
            if (!std::getline(input, piece, delim))
                throw parse_error("unterminated quoted field");
            result += delim;
            result += piece;
        }

        return result.substr(1, result.size() - 2);
    }

    double parse_amount(const std::string& str)
    {
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(str.c_str(), &end);
        if (str.empty() || *end != '\0' || errno == ERANGE)
            throw parse_error("bad amount '" + str + "'");
        return value;
    }

    txngen::TransactionStatus parse_status(const std::string& str)
    {
        auto status = txngen::status_from_string(str);
        if (!status)
            throw parse_error("unknown status '" + str + "'");
        return *status;
    }

    std::optional<txngen::DeclineReason> parse_decline_reason(const std::string& str)
    {
        if (str.empty())
            return {};

        auto reason = txngen::decline_reason_from_string(str);
        if (!reason)
            throw parse_error("unknown decline reason '" + str + "'");
        return reason;
    }

    txngen::Transaction parse_csv_line(const std::string& line)
    {
        std::istringstream in{line};
        txngen::Transaction tx;

        tx.transaction_id = next_field(in, ',');
        tx.transaction_date = next_field(in, ',');
        tx.status = parse_status(next_field(in, ','));
        tx.decline_reason = parse_decline_reason(next_field(in, ','));
        tx.cardholder_name = next_quoted(in, ',');
        tx.card_number = next_field(in, ',');
        tx.card_brand = next_field(in, ',');
        tx.card_expiry = next_field(in, ',');
        tx.cvv = next_field(in, ',');
        tx.amount = parse_amount(next_field(in, ','));
        tx.currency = next_field(in, ',');
        tx.merchant_name = next_field(in, ',');
        tx.merchant_id = next_field(in, ',');
        tx.merchant_category = next_field(in, ',');
        tx.payment_method = next_field(in, ',');
        tx.ip_address = next_field(in, ',');
        tx.device_id = next_field(in, ',');
        tx.user_agent = next_quoted(in, ',');

        // the last field has to run to the end of the line, not stop at a delimiter
        if (!in.eof())
            throw parse_error("too many fields");

        return tx;
    }

    std::string csv_header()
    {
        std::string header;
        for (const auto& name : txngen::FIELD_NAMES)
        {
            if (!header.empty())
                header += ',';
            header += name;
        }
        return header;
    }

    template<typename Func>
    auto read_file(const std::filesystem::path& file, Func read) -> decltype(read(std::declval<std::istream&>()))
    {
        errno = 0;
        std::ifstream in(file);
        if (!in.is_open())
            throw std::system_error(errno != 0 ? errno : EIO, std::generic_category(), "unable to open " + file.string());
        return read(in);
    }
}

std::vector<txngen::Transaction> txngen::readers::read_csv(std::istream& in)
{
    std::vector<Transaction> transactions;
    std::string line;
    size_t line_number = 0;

    auto strip_cr = [](std::string& str) {
        if (!str.empty() && str.back() == '\r')
            str.pop_back();
    };

    if (!std::getline(in, line))
        throw std::runtime_error("csv line 1: missing header");
    ++line_number;
    strip_cr(line);
    if (line != csv_header())
        throw std::runtime_error("csv line 1: unexpected header '" + line + "'");

    while (std::getline(in, line))
    {
        ++line_number;
        strip_cr(line);
        if (line.empty())
            continue;

        try
        {
            transactions.emplace_back(parse_csv_line(line));
        }
        catch (const parse_error& e)
        {
            throw std::runtime_error("csv line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    return transactions;
}

std::vector<txngen::Transaction> txngen::readers::read_json(std::istream& in)
{
    std::vector<Transaction> transactions;

    try
    {
        nlohmann::json j;
        in >> j;

        if (!j.is_array())
            throw std::runtime_error("json: expected an array of transactions");

        for (const auto& obj : j)
        {
            Transaction tx;
            tx.transaction_id = obj.at("transaction_id").get<std::string>();
            tx.transaction_date = obj.at("transaction_date").get<std::string>();
            tx.status = parse_status(obj.at("status").get<std::string>());
            if (!obj.at("decline_reason").is_null())
                tx.decline_reason = parse_decline_reason(obj.at("decline_reason").get<std::string>());
            tx.cardholder_name = obj.at("cardholder_name").get<std::string>();
            tx.card_number = obj.at("card_number").get<std::string>();
            tx.card_brand = obj.at("card_brand").get<std::string>();
            tx.card_expiry = obj.at("card_expiry").get<std::string>();
            tx.cvv = obj.at("cvv").get<std::string>();
            tx.amount = obj.at("amount").get<double>();
            tx.currency = obj.at("currency").get<std::string>();
            tx.merchant_name = obj.at("merchant_name").get<std::string>();
            tx.merchant_id = obj.at("merchant_id").get<std::string>();
            tx.merchant_category = obj.at("merchant_category").get<std::string>();
            tx.payment_method = obj.at("payment_method").get<std::string>();
            tx.ip_address = obj.at("ip_address").get<std::string>();
            tx.device_id = obj.at("device_id").get<std::string>();
            tx.user_agent = obj.at("user_agent").get<std::string>();
            transactions.emplace_back(std::move(tx));
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::runtime_error(std::string{"json: "} + e.what());
    }
    catch (const parse_error& e)
    {
        throw std::runtime_error("json record " + std::to_string(transactions.size() + 1) + ": " + e.what());
    }

    return transactions;
}

std::vector<txngen::Transaction> txngen::readers::read_csv(const fs::path& file)
{
    return read_file(file, [](std::istream& in) { return read_csv(in); });
}

std::vector<txngen::Transaction> txngen::readers::read_json(const fs::path& file)
{
    return read_file(file, [](std::istream& in) { return read_json(in); });
}
