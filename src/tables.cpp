#include "tables.hpp"

#include <algorithm>

namespace
{
    txngen::ReferenceTables build_default_tables()
    {
        txngen::ReferenceTables tables;

        tables.card_brands = {
            { "Visa", { "4" }, { 16 }, 3 },
            { "Mastercard", { "51", "52", "53", "54", "55" }, { 16 }, 3 },
            { "American Express", { "34", "37" }, { 15 }, 4 },
            { "Discover", { "6011", "644", "645", "646", "647", "648", "649", "65" }, { 16 }, 3 },
        };

        tables.merchants = {
            { "Acme Retail", "MER12345", "Retail" },
            { "Sunshine Groceries", "MER22468", "Grocery" },
            { "Tech Universe", "MER39521", "Electronics" },
            { "Cozy Coffee Shop", "MER41327", "Food & Beverage" },
            { "Fitness Plus", "MER57845", "Health & Fitness" },
            { "BookWorld", "MER61234", "Books & Media" },
            { "QuickMart", "MER78523", "Convenience Store" },
            { "Urban Fashion", "MER84751", "Clothing" },
            { "Travel Now", "MER92456", "Travel" },
            { "Gourmet Dining", "MER10387", "Restaurant" },
        };

        tables.first_names = {
            "John", "Jane", "Michael", "Emily", "David",
            "Sarah", "Robert", "Lisa", "William", "Emma",
            "James", "Olivia", "Daniel", "Sophia", "Matthew",
            "Ava", "Christopher", "Mia", "Andrew", "Isabella",
        };

        tables.last_names = {
            "Smith", "Johnson", "Williams", "Brown", "Jones",
            "Garcia", "Miller", "Davis", "Rodriguez", "Martinez",
            "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson",
            "Thomas", "Taylor", "Moore", "Jackson", "Martin",
        };

        tables.currencies = { "USD", "EUR", "GBP", "CAD", "AUD", "JPY" };

        tables.user_agents = {
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36",
            "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.1.1 Safari/605.1.15",
            "Mozilla/5.0 (iPhone; CPU iPhone OS 14_6 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.0 Mobile/15E148 Safari/604.1",
        };

        return tables;
    }
}

const txngen::ReferenceTables& txngen::default_tables()
{
    static const ReferenceTables tables = build_default_tables();
    return tables;
}

const txngen::CardBrand* txngen::find_brand(const ReferenceTables& tables, const std::string_view& name)
{
    auto it = std::find_if(tables.card_brands.begin(), tables.card_brands.end(),
            [&name](const auto& brand) { return brand.name == name; });
    return it == tables.card_brands.end() ? nullptr : &*it;
}

const txngen::Merchant* txngen::find_merchant(const ReferenceTables& tables, const std::string_view& id)
{
    auto it = std::find_if(tables.merchants.begin(), tables.merchants.end(),
            [&id](const auto& merchant) { return merchant.id == id; });
    return it == tables.merchants.end() ? nullptr : &*it;
}
