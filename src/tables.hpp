#pragma once

#include <string>
#include <vector>

#include "models.hpp"

namespace txngen
{
    /**
     * Everything a record is sampled from. The defaults are built once and
     * never change; tests hand in their own, narrower tables.
     */
    struct ReferenceTables
    {
        std::vector<CardBrand> card_brands;
        std::vector<Merchant> merchants;
        std::vector<std::string> first_names;
        std::vector<std::string> last_names;
        std::vector<std::string> currencies;
        std::vector<std::string> user_agents;
    };

    const ReferenceTables& default_tables();

    /**
     * @return A pointer into `tables`, or nullptr if no brand has that name
     */
    const CardBrand* find_brand(const ReferenceTables& tables, const std::string_view& name);
    const Merchant* find_merchant(const ReferenceTables& tables, const std::string_view& id);
}
