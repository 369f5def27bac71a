#pragma once

#include <string>
#include <vector>

#include "models.hpp"
#include "tables.hpp"

namespace txngen::validation
{
    /**
     * Checks one transaction against the rules every generated record follows.
     *
     * @param tx The transaction to check
     * @param tables The tables the transaction was drawn from
     * @param require_luhn Whether card numbers must pass the Luhn check. Numbers
     *        generated in legacy checksum mode don't always.
     * @return A description of every problem found, empty if there are none
     */
    std::vector<std::string> validate(const Transaction& tx, const ReferenceTables& tables = default_tables(), bool require_luhn = true);

    /**
     * Field for field comparison, with the amount compared to the cent.
     */
    bool equivalent(const Transaction& lhs, const Transaction& rhs);
}
