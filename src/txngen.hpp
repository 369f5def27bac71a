#pragma once

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "options.hpp"
#include "models.hpp"

namespace txngen
{
    namespace fs = std::filesystem;

    /**
     * The logger registered as "console", or spdlog's default logger when
     * nothing registered one.
     */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * The logger registered as "stderr", for failures. Falls back like logger().
     */
    std::shared_ptr<spdlog::logger> error_logger();

    /**
     * @return dir/transactions_<count>.<extension>
     */
    fs::path dataset_path(const fs::path& dir, int64_t count, const std::string_view& extension);

    /**
     * Reads `file` back and checks it holds exactly `expected`, and that every
     * record passes validation.
     *
     * @throws std::runtime_error describing the first problems found
     */
    void verify_dataset(const fs::path& file, const std::vector<Transaction>& expected, ChecksumMode mode);

    /**
     * Generates one dataset per configured size and writes each one out in every
     * enabled format. Stops at the first failure, files written before it are
     * left in place.
     *
     * @return The files written, in the order they were written
     * @throws std::invalid_argument if the options are invalid
     * @throws std::system_error if the output directory or a file can't be written
     * @throws std::runtime_error if verification is on and a file doesn't match
     */
    std::vector<fs::path> process(const GeneratorOptions& options);
}
