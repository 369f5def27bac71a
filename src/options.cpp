#include "options.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <popl.hpp>
#include <spdlog/spdlog.h>

#include "env.hpp"
#include "generation.hpp"

namespace fs = std::filesystem;

constexpr const char DEFAULT_CONFIG_FILE[] = "txngen.json";

txngen::GeneratorOptions txngen::parse_options_from_file(const fs::path& file, GeneratorOptions opts)
{
    std::ifstream i(file);
    if (!i.is_open())
        throw std::invalid_argument("unable to open config file " + file.string());

    try
    {
        nlohmann::json j;
        i >> j;

        auto get_or_default = [&j](const char* name, auto default_val) -> decltype(default_val)
        {
            auto it = j.find(name);
            if (it == j.end() || it->is_null())
                return default_val;

            return it->template get<decltype(default_val)>();
        };

        opts.output_directory = get_or_default("output_directory", opts.output_directory);
        opts.sizes = get_or_default("sizes", opts.sizes);
        opts.write_csv = get_or_default("csv", opts.write_csv);
        opts.write_json = get_or_default("json", opts.write_json);
        opts.verify = get_or_default("verify", opts.verify);
        opts.log_level = get_or_default("log_level", opts.log_level);

        if (auto it = j.find("seed"); it != j.end() && !it->is_null())
        {
            // get<uint64_t>() wraps negative numbers around
            if (!it->is_number_unsigned())
                throw std::invalid_argument("bad config file " + file.string() + ": seed must be a non-negative integer");
            opts.seed = it->get<uint64_t>();
        }

        if (auto it = j.find("checksum"); it != j.end() && !it->is_null())
            opts.checksum_mode = parse_checksum_mode(it->get<std::string>());
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument("bad config file " + file.string() + ": " + e.what());
    }

    return opts;
}

txngen::GeneratorOptions txngen::apply_environment(GeneratorOptions options)
{
    if (auto dir = env::get_string("TXNGEN_OUTPUT_DIR"))
        options.output_directory = *dir;

    if (auto seed = env::get_uint("TXNGEN_SEED"))
        options.seed = *seed;

    if (auto mode = env::get_string("TXNGEN_CHECKSUM"))
        options.checksum_mode = parse_checksum_mode(*mode);

    options.verify = env::get_bool("TXNGEN_VERIFY", options.verify);
    options.log_level = env::get_string("TXNGEN_LOG_LEVEL", options.log_level);

    return options;
}

txngen::GeneratorOptions txngen::parse_options(int argc, const char** argv)
{
    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto out_opt = op.add<popl::Value<std::string>>("o", "output", "directory to write the datasets to");
    auto count_opt = op.add<popl::Value<int64_t>>("n", "count", "records in a dataset, repeat for more datasets");
    auto seed_opt = op.add<popl::Value<int64_t>>("s", "seed", "seed for the random engine");
    auto checksum_opt = op.add<popl::Value<std::string>>("", "checksum", "card number checksum mode, strict or legacy");
    auto nocsv_opt = op.add<popl::Switch>("", "no-csv", "don't write csv files");
    auto nojson_opt = op.add<popl::Switch>("", "no-json", "don't write json files");
    auto verify_opt = op.add<popl::Switch>("", "verify", "read every file back and check it");
    auto level_opt = op.add<popl::Value<std::string>>("l", "log-level", "trace, debug, info, warn, error or off");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        std::cout << "usage:\n";
        std::cout << "\t" << argv[0] << " [OPTIONS]\n\n";
        std::cout << op << "\n";
        std::exit(EXIT_SUCCESS);
    }

    if (!op.unknown_options().empty())
        throw std::invalid_argument("unknown option " + op.unknown_options().front());
    if (!op.non_option_args().empty())
        throw std::invalid_argument("unexpected argument " + op.non_option_args().front());

    GeneratorOptions options;
    if (conf_opt->is_set())
    {
        options = parse_options_from_file(conf_opt->value());
    }
    else
    {
        auto configFile = env::get_string("TXNGEN_CONFIG_FILE", DEFAULT_CONFIG_FILE);
        if (fs::exists(configFile))
            options = parse_options_from_file(configFile);
    }

    options = apply_environment(std::move(options));

    if (out_opt->is_set())
        options.output_directory = out_opt->value();

    if (count_opt->is_set())
    {
        options.sizes.clear();
        for (size_t n = 0; n < count_opt->count(); ++n)
            options.sizes.push_back(count_opt->value(n));
    }

    if (seed_opt->is_set())
    {
        if (seed_opt->value() < 0)
            throw std::invalid_argument("--seed must not be negative");
        options.seed = (uint64_t)seed_opt->value();
    }

    if (checksum_opt->is_set())
        options.checksum_mode = parse_checksum_mode(checksum_opt->value());
    if (nocsv_opt->is_set())
        options.write_csv = false;
    if (nojson_opt->is_set())
        options.write_json = false;
    if (verify_opt->is_set())
        options.verify = true;
    if (level_opt->is_set())
        options.log_level = level_opt->value();

    check_options(options);
    return options;
}

void txngen::check_options(const GeneratorOptions& options)
{
    if (options.sizes.empty())
        throw std::invalid_argument("at least one dataset size is required");

    for (size_t i = 0; i < options.sizes.size(); ++i)
    {
        auto size = options.sizes[i];
        if (size < 0 || size > generation::MAX_BATCH_SIZE)
            throw std::invalid_argument("dataset size " + std::to_string(size) + " is outside [0, " + std::to_string(generation::MAX_BATCH_SIZE) + "]");

        // the size names the output file, a repeat would overwrite an earlier dataset
        if (std::find(options.sizes.begin(), options.sizes.begin() + i, size) != options.sizes.begin() + i)
            throw std::invalid_argument("dataset size " + std::to_string(size) + " is listed twice");
    }

    if (!options.write_csv && !options.write_json)
        throw std::invalid_argument("csv and json output are both disabled, so nothing would be written!");

    if (options.output_directory.empty())
        throw std::invalid_argument("the output directory must not be empty");

    // spdlog maps anything it doesn't recognise to `off`
    if (spdlog::level::from_str(options.log_level) == spdlog::level::off && options.log_level != "off")
        throw std::invalid_argument("unknown log level '" + options.log_level + "'");
}

txngen::ChecksumMode txngen::parse_checksum_mode(const std::string_view& str)
{
    if (str == "strict")
        return ChecksumMode::Strict;
    if (str == "legacy")
        return ChecksumMode::Legacy;

    throw std::invalid_argument("unknown checksum mode '" + std::string{str} + "', expected strict or legacy");
}

std::string_view txngen::to_string(ChecksumMode mode)
{
    switch (mode)
    {
    case ChecksumMode::Strict: return "strict";
    case ChecksumMode::Legacy: return "legacy";
    }
    return "unknown";
}
