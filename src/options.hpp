#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cards.hpp"

namespace txngen
{
    /**
     * Everything a run can be configured with.
     *
     * Options can be set from:
     *   A txngen.json config file
     *   Environment variables
     *   Command line flags
     *
     * Later sources override earlier ones, so
     * defaults -> config file -> environment variables -> command line flags.
     */
    struct GeneratorOptions
    {
        std::vector<int64_t> sizes {100, 250, 500};
        std::string output_directory = ".";
        std::optional<uint64_t> seed;
        ChecksumMode checksum_mode = ChecksumMode::Strict;
        bool write_csv = true;
        bool write_json = true;
        bool verify = false;
        std::string log_level = "info";
    };

    /**
     * Reads options from a json config file, keeping the defaults for any key
     * that's missing. The format of the file is:
     * @code
     * {
     *      "output_directory": string,
     *      "sizes": [int, ...],
     *      "seed": int,
     *      "checksum": "strict" | "legacy",
     *      "csv": bool,
     *      "json": bool,
     *      "verify": bool,
     *      "log_level": string
     * }
     * @endcode
     * @throws std::invalid_argument if the file can't be parsed or a value has the wrong type
     */
    GeneratorOptions parse_options_from_file(const std::filesystem::path& file, GeneratorOptions defaults = {});

    /**
     * Overrides `options` with whichever TXNGEN_* environment variables are set.
     */
    GeneratorOptions apply_environment(GeneratorOptions options);

    /**
     * Generates a GeneratorOptions structure from the config file, environment
     * variables and command line arguments, and sanity checks it.
     *
     * @param argc Argument count passed in from `main`
     * @param argv Argument list passed in from `main`
     * @returns A populated and sanity checked GeneratorOptions struct
     * @throws std::invalid_argument Thrown whenever a sanity check fails
     */
    GeneratorOptions parse_options(int argc, const char** argv);

    /**
     * @throws std::invalid_argument if any option is out of range
     */
    void check_options(const GeneratorOptions& options);

    ChecksumMode parse_checksum_mode(const std::string_view& str);
    std::string_view to_string(ChecksumMode mode);
}
