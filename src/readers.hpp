#pragma once

#include <filesystem>
#include <istream>
#include <vector>

#include "models.hpp"

namespace txngen::readers
{
    namespace fs = std::filesystem;

    /**
     * Reads back a file produced by writers::write_csv.
     *
     * @throws std::runtime_error on a bad header, a line with the wrong number of
     *         fields, or a field that doesn't parse. The message names the line.
     */
    std::vector<Transaction> read_csv(std::istream& in);

    /**
     * Reads back a file produced by writers::write_json.
     *
     * @throws std::runtime_error if the document isn't an array of transaction objects
     */
    std::vector<Transaction> read_json(std::istream& in);

    /**
     * @throws std::system_error if the file can't be opened
     */
    std::vector<Transaction> read_csv(const fs::path& file);
    std::vector<Transaction> read_json(const fs::path& file);
}
