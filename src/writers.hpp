#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include "models.hpp"

namespace txngen::writers
{
    namespace fs = std::filesystem;

    /**
     * Writes a header line followed by one comma separated line per transaction.
     * The cardholder name and user agent are wrapped in double quotes, nothing
     * else is escaped.
     */
    void write_csv(const std::vector<Transaction>& transactions, std::ostream& out);

    /**
     * Writes the transactions as a pretty printed JSON array. A missing decline
     * reason is written as null.
     */
    void write_json(const std::vector<Transaction>& transactions, std::ostream& out);

    /**
     * Both of these truncate `file` before writing to it.
     *
     * @throws std::system_error if the file can't be opened or written
     */
    void write_csv(const std::vector<Transaction>& transactions, const fs::path& file);
    void write_json(const std::vector<Transaction>& transactions, const fs::path& file);
}
