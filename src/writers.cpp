#include "writers.hpp"

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <system_error>

#include <nlohmann/json.hpp>

namespace
{
    int last_error()
    {
        return errno != 0 ? errno : EIO;
    }

    template<typename Func>
    void write_file(const std::filesystem::path& file, Func write)
    {
        errno = 0;
        std::ofstream out(file, std::ios::out | std::ios::trunc);
        if (!out.is_open())
            throw std::system_error(last_error(), std::generic_category(), "unable to open " + file.string());

        write(out);
        out.close();

        if (out.fail())
            throw std::system_error(last_error(), std::generic_category(), "unable to write " + file.string());
    }
}

void txngen::writers::write_csv(const std::vector<Transaction>& transactions, std::ostream& out)
{
    bool first = true;
    for (const auto& name : FIELD_NAMES)
    {
        if (!first)
            out << ',';
        out << name;
        first = false;
    }
    out << '\n';

    auto flags = out.flags();
    auto precision = out.precision();

    out << std::fixed << std::setprecision(2);
    for (const auto& tx : transactions)
    {
        out << tx.transaction_id << ','
            << tx.transaction_date << ','
            << to_string(tx.status) << ','
            << (tx.decline_reason ? to_string(*tx.decline_reason) : std::string_view{}) << ','
            << '"' << tx.cardholder_name << '"' << ','
            << tx.card_number << ','
            << tx.card_brand << ','
            << tx.card_expiry << ','
            << tx.cvv << ','
            << tx.amount << ','
            << tx.currency << ','
            << tx.merchant_name << ','
            << tx.merchant_id << ','
            << tx.merchant_category << ','
            << tx.payment_method << ','
            << tx.ip_address << ','
            << tx.device_id << ','
            << '"' << tx.user_agent << '"' << '\n';
    }

    out.flags(flags);
    out.precision(precision);
}

void txngen::writers::write_json(const std::vector<Transaction>& transactions, std::ostream& out)
{
    // ordered_json keeps the keys in the same order as the CSV columns
    auto array = nlohmann::ordered_json::array();
    for (const auto& tx : transactions)
    {
        nlohmann::ordered_json obj;
        obj["transaction_id"] = tx.transaction_id;
        obj["transaction_date"] = tx.transaction_date;
        obj["status"] = std::string{to_string(tx.status)};
        if (tx.decline_reason)
            obj["decline_reason"] = std::string{to_string(*tx.decline_reason)};
        else
            obj["decline_reason"] = nullptr;
        obj["cardholder_name"] = tx.cardholder_name;
        obj["card_number"] = tx.card_number;
        obj["card_brand"] = tx.card_brand;
        obj["card_expiry"] = tx.card_expiry;
        obj["cvv"] = tx.cvv;
        obj["amount"] = tx.amount;
        obj["currency"] = tx.currency;
        obj["merchant_name"] = tx.merchant_name;
        obj["merchant_id"] = tx.merchant_id;
        obj["merchant_category"] = tx.merchant_category;
        obj["payment_method"] = tx.payment_method;
        obj["ip_address"] = tx.ip_address;
        obj["device_id"] = tx.device_id;
        obj["user_agent"] = tx.user_agent;
        array.push_back(std::move(obj));
    }

    out << array.dump(2);
}

void txngen::writers::write_csv(const std::vector<Transaction>& transactions, const fs::path& file)
{
    write_file(file, [&transactions](std::ostream& out) { write_csv(transactions, out); });
}

void txngen::writers::write_json(const std::vector<Transaction>& transactions, const fs::path& file)
{
    write_file(file, [&transactions](std::ostream& out) { write_json(transactions, out); });
}
