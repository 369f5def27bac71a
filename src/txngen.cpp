#include "txngen.hpp"

#include <chrono>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "generation.hpp"
#include "readers.hpp"
#include "validation.hpp"
#include "writers.hpp"

namespace
{
    constexpr size_t MAX_REPORTED_PROBLEMS = 10;

    std::string join_names(const std::vector<txngen::fs::path>& files)
    {
        std::string out;
        for (const auto& file : files)
        {
            if (!out.empty())
                out += ", ";
            out += file.filename().string();
        }
        return out;
    }
}

std::shared_ptr<spdlog::logger> txngen::logger()
{
    if (auto console = spdlog::get("console"))
        return console;
    return spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> txngen::error_logger()
{
    if (auto errors = spdlog::get("stderr"))
        return errors;
    return spdlog::default_logger();
}

txngen::fs::path txngen::dataset_path(const fs::path& dir, int64_t count, const std::string_view& extension)
{
    std::ostringstream name;
    name << "transactions_" << count << '.' << extension;
    return dir / name.str();
}

void txngen::verify_dataset(const fs::path& file, const std::vector<Transaction>& expected, ChecksumMode mode)
{
    auto actual = file.extension() == ".csv" ? readers::read_csv(file) : readers::read_json(file);

    std::vector<std::string> problems;
    if (actual.size() != expected.size())
    {
        problems.emplace_back("expected " + std::to_string(expected.size()) + " records, read " + std::to_string(actual.size()));
    }
    else
    {
        bool require_luhn = mode == ChecksumMode::Strict;
        for (size_t i = 0; i < actual.size() && problems.size() < MAX_REPORTED_PROBLEMS; ++i)
        {
            if (!validation::equivalent(actual[i], expected[i]))
                problems.emplace_back("record " + std::to_string(i + 1) + " (" + expected[i].transaction_id + ") differs from what was generated");

            for (auto& problem : validation::validate(actual[i], default_tables(), require_luhn))
                problems.emplace_back("record " + std::to_string(i + 1) + ": " + problem);
        }
    }

    if (problems.empty())
    {
        logger()->debug("Verified {} ({} records)", file.string(), actual.size());
        return;
    }

    for (const auto& problem : problems)
        error_logger()->error("{}: {}", file.string(), problem);

    throw std::runtime_error("verification of " + file.string() + " failed: " + problems.front());
}

std::vector<txngen::fs::path> txngen::process(const GeneratorOptions& options)
{
    check_options(options);

    fs::path out_dir = options.output_directory;
    if (fs::exists(out_dir) && !fs::is_directory(out_dir))
        throw std::invalid_argument(out_dir.string() + " is not a directory!");
    if (!fs::exists(out_dir))
        fs::create_directories(out_dir);

    uint64_t seed;
    if (options.seed)
    {
        seed = *options.seed;
    }
    else
    {
        std::random_device rd;
        seed = ((uint64_t)rd() << 32) | rd();
    }

    auto log = logger();
    log->debug("Using seed {} with {} card checksums", seed, to_string(options.checksum_mode));

    auto start = std::chrono::system_clock::now();
    generation::Context context{seed, options.checksum_mode};

    log->info("Generating test datasets...");
    std::vector<std::pair<int64_t, std::vector<Transaction>>> datasets;
    datasets.reserve(options.sizes.size());
    for (auto size : options.sizes)
    {
        datasets.emplace_back(size, generation::generate_transactions(size, context));
        log->debug("Generated {} transactions", size);
    }

    log->info("Writing datasets to files...");
    std::vector<fs::path> csv_files;
    std::vector<fs::path> json_files;

    if (options.write_csv)
    {
        for (const auto& [size, transactions] : datasets)
        {
            auto file = dataset_path(out_dir, size, "csv");
            writers::write_csv(transactions, file);
            log->debug("Wrote {}", file.string());
            csv_files.push_back(std::move(file));
        }
    }

    if (options.write_json)
    {
        for (const auto& [size, transactions] : datasets)
        {
            auto file = dataset_path(out_dir, size, "json");
            writers::write_json(transactions, file);
            log->debug("Wrote {}", file.string());
            json_files.push_back(std::move(file));
        }
    }

    if (options.verify)
    {
        log->info("Verifying datasets...");
        for (size_t i = 0; i < datasets.size(); ++i)
        {
            if (options.write_csv)
                verify_dataset(csv_files[i], datasets[i].second, options.checksum_mode);
            if (options.write_json)
                verify_dataset(json_files[i], datasets[i].second, options.checksum_mode);
        }
    }

    std::vector<fs::path> written;
    written.insert(written.end(), csv_files.begin(), csv_files.end());
    written.insert(written.end(), json_files.begin(), json_files.end());

    log->info("Done! Generated {} files:", written.size());
    if (!csv_files.empty())
        log->info("- CSV files: {}", join_names(csv_files));
    if (!json_files.empty())
        log->info("- JSON files: {}", join_names(json_files));

    auto end = std::chrono::system_clock::now();

    using ToSeconds = std::chrono::duration<double>;
    auto timeTook = ToSeconds(end - start).count();
    log->debug("Finished processing in {} seconds", timeTook);

    return written;
}
