#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "generation.hpp"
#include "readers.hpp"
#include "txngen.hpp"
#include "validation.hpp"
#include "writers.hpp"

using namespace txngen;
namespace fs = std::filesystem;

namespace
{
    const std::string HEADER =
        "transaction_id,transaction_date,status,decline_reason,cardholder_name,card_number,card_brand,"
        "card_expiry,cvv,amount,currency,merchant_name,merchant_id,merchant_category,payment_method,"
        "ip_address,device_id,user_agent";

    Transaction sample_transaction()
    {
        return {
            "TXN7K2Q9ZP0A",
            "2024-02-29T08:15:00.000042+00:00",
            TransactionStatus::Declined,
            DeclineReason::InsufficientFunds,
            "Jane Smith",
            "4111111111111111",
            "Visa",
            "07/28",
            "123",
            12.5,
            "EUR",
            "Cozy Coffee Shop",
            "MER41327",
            "Food & Beverage",
            "credit_card",
            "10.0.254.1",
            "DEV12345",
            "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko)"
        };
    }

    std::vector<std::string> lines_of(const std::string& text)
    {
        std::vector<std::string> lines;
        std::istringstream in{text};
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    /**
     * A scratch directory that's removed again when the test ends.
     */
    class TempDir
    {
        fs::path m_path;
    public:
        TempDir()
        {
            std::random_device rd;
            m_path = fs::temp_directory_path() / ("txngen_test_" + std::to_string(rd()));
            fs::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        const fs::path& path() const { return m_path; }
    };
}

TEST_CASE("CSV output starts with the 18 column header", "[txngen::writers]")
{
    std::ostringstream out;
    writers::write_csv({}, out);

    REQUIRE(out.str() == HEADER + "\n");
}

TEST_CASE("CSV rows quote the free text fields", "[txngen::writers]")
{
    auto tx = sample_transaction();
    std::ostringstream out;
    writers::write_csv({ tx }, out);

    auto lines = lines_of(out.str());
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1] ==
        "TXN7K2Q9ZP0A,2024-02-29T08:15:00.000042+00:00,declined,insufficient_funds,\"Jane Smith\","
        "4111111111111111,Visa,07/28,123,12.50,EUR,Cozy Coffee Shop,MER41327,Food & Beverage,credit_card,"
        "10.0.254.1,DEV12345,\"Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko)\"");
}

TEST_CASE("CSV output leaves the stream's number format alone", "[txngen::writers]")
{
    std::ostringstream out;
    out << std::setprecision(4);
    auto flags = out.flags();

    writers::write_csv({ sample_transaction() }, out);

    REQUIRE(out.flags() == flags);
    REQUIRE(out.precision() == 4);

    out.str("");
    out << 1.5;
    REQUIRE(out.str() == "1.5");
}

TEST_CASE("CSV leaves the decline reason empty when there is none", "[txngen::writers]")
{
    auto tx = sample_transaction();
    tx.status = TransactionStatus::Approved;
    tx.decline_reason.reset();
    tx.currency = "JPY";
    tx.amount = 4200;

    std::ostringstream out;
    writers::write_csv({ tx }, out);

    auto row = lines_of(out.str()).at(1);
    REQUIRE(row.find(",approved,,\"Jane Smith\",") != std::string::npos);
    REQUIRE(row.find(",4200.00,JPY,") != std::string::npos);
}

TEST_CASE("JSON output is an array of objects keyed like the CSV header", "[txngen::writers]")
{
    auto declined = sample_transaction();
    auto approved = sample_transaction();
    approved.status = TransactionStatus::Approved;
    approved.decline_reason.reset();

    std::ostringstream out;
    writers::write_json({ declined, approved }, out);

    auto j = nlohmann::ordered_json::parse(out.str());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);

    for (const auto& obj : j)
    {
        REQUIRE(obj.size() == FIELD_NAMES.size());
        size_t i = 0;
        for (const auto& item : obj.items())
            REQUIRE(item.key() == FIELD_NAMES[i++]);
    }

    REQUIRE(j[0]["decline_reason"] == "insufficient_funds");
    REQUIRE(j[0]["amount"].is_number());
    REQUIRE(j[0]["amount"].get<double>() == Approx(12.5));
    REQUIRE(j[0]["card_number"].is_string());
    REQUIRE(j[1]["decline_reason"].is_null());
    REQUIRE(j[1]["status"] == "approved");
}

TEST_CASE("JSON output is indented", "[txngen::writers]")
{
    std::ostringstream out;
    writers::write_json({ sample_transaction() }, out);

    auto lines = lines_of(out.str());
    REQUIRE(lines.front() == "[");
    REQUIRE(lines.at(1) == "  {");
    REQUIRE(lines.at(2) == "    \"transaction_id\": \"TXN7K2Q9ZP0A\",");
    REQUIRE(lines.back() == "]");
}

TEST_CASE("An empty batch gives a header only CSV and an empty JSON array", "[txngen::writers]")
{
    generation::Context context{21};
    auto transactions = generation::generate_transactions(0, context);

    std::ostringstream csv;
    std::ostringstream json;
    writers::write_csv(transactions, csv);
    writers::write_json(transactions, json);

    REQUIRE(lines_of(csv.str()).size() == 1);
    REQUIRE(json.str() == "[]");

    std::istringstream csv_in{csv.str()};
    std::istringstream json_in{json.str()};
    REQUIRE(readers::read_csv(csv_in).empty());
    REQUIRE(readers::read_json(json_in).empty());
}

TEST_CASE("Both formats hold all 100 records of a batch", "[txngen::writers]")
{
    generation::Context context{22};
    auto transactions = generation::generate_transactions(100, context);

    std::ostringstream csv;
    std::ostringstream json;
    writers::write_csv(transactions, csv);
    writers::write_json(transactions, json);

    REQUIRE(lines_of(csv.str()).size() == 101);
    REQUIRE(nlohmann::json::parse(json.str()).size() == 100);
}

TEST_CASE("CSV and JSON read back to the same records", "[txngen::readers]")
{
    generation::Context context{23};
    auto transactions = generation::generate_transactions(250, context);

    std::stringstream csv;
    std::stringstream json;
    writers::write_csv(transactions, csv);
    writers::write_json(transactions, json);

    auto from_csv = readers::read_csv(csv);
    auto from_json = readers::read_json(json);

    REQUIRE(from_csv.size() == transactions.size());
    REQUIRE(from_json.size() == transactions.size());
    for (size_t i = 0; i < transactions.size(); ++i)
    {
        REQUIRE(validation::equivalent(from_csv[i], transactions[i]));
        REQUIRE(validation::equivalent(from_json[i], transactions[i]));
        REQUIRE(validation::equivalent(from_csv[i], from_json[i]));
        REQUIRE(from_csv[i].decline_reason == from_json[i].decline_reason);
    }
}

TEST_CASE("Reading malformed CSV names the line", "[txngen::readers]")
{
    SECTION("wrong header")
    {
        std::istringstream in{"id,date\n"};
        REQUIRE_THROWS_WITH(readers::read_csv(in), Catch::Contains("line 1"));
    }

    SECTION("missing fields")
    {
        std::istringstream in{HEADER + "\nTXN000000000,2024-01-01T00:00:00.000000+00:00,approved\n"};
        REQUIRE_THROWS_WITH(readers::read_csv(in), Catch::Contains("line 2"));
    }

    SECTION("trailing empty field")
    {
        std::ostringstream out;
        writers::write_csv({ sample_transaction() }, out);
        auto text = out.str();
        text.insert(text.size() - 1, ",");

        std::istringstream in{text};
        REQUIRE_THROWS_WITH(readers::read_csv(in), Catch::Contains("line 2") && Catch::Contains("too many fields"));
    }

    SECTION("extra field after the user agent")
    {
        std::ostringstream out;
        writers::write_csv({ sample_transaction() }, out);
        auto text = out.str();
        text.insert(text.size() - 1, ",\"extra\"");

        std::istringstream in{text};
        REQUIRE_THROWS_WITH(readers::read_csv(in), Catch::Contains("too many fields"));
    }

    SECTION("unknown status")
    {
        std::ostringstream out;
        auto tx = sample_transaction();
        writers::write_csv({ tx }, out);
        auto text = out.str();
        text.replace(text.find(",declined,"), 10, ",rejected,");

        std::istringstream in{text};
        REQUIRE_THROWS_WITH(readers::read_csv(in), Catch::Contains("unknown status"));
    }
}

TEST_CASE("Reading malformed JSON fails", "[txngen::readers]")
{
    std::istringstream not_json{"{ nope"};
    REQUIRE_THROWS_AS(readers::read_json(not_json), std::runtime_error);

    std::istringstream not_array{"{}"};
    REQUIRE_THROWS_AS(readers::read_json(not_array), std::runtime_error);

    std::istringstream missing_key{R"([{"transaction_id": "TXN000000000"}])"};
    REQUIRE_THROWS_AS(readers::read_json(missing_key), std::runtime_error);
}

TEST_CASE("Writers overwrite existing files", "[txngen::writers]")
{
    TempDir dir;
    auto file = dir.path() / "transactions_1.csv";
    {
        std::ofstream stale(file);
        stale << std::string(100000, 'x');
    }

    writers::write_csv({ sample_transaction() }, file);

    auto read = readers::read_csv(file);
    REQUIRE(read.size() == 1);
    REQUIRE(validation::equivalent(read.front(), sample_transaction()));
}

TEST_CASE("Writing to a missing directory reports the I/O error", "[txngen::writers]")
{
    TempDir dir;
    auto file = dir.path() / "missing" / "transactions_1.json";

    REQUIRE_THROWS_AS(writers::write_json({ sample_transaction() }, file), std::system_error);
    REQUIRE_THROWS_AS(writers::write_csv({ sample_transaction() }, file), std::system_error);
    REQUIRE_THROWS_AS(readers::read_json(file), std::system_error);
}

TEST_CASE("Dataset files are named after their size", "[txngen::process]")
{
    REQUIRE(dataset_path("out", 100, "csv") == fs::path("out") / "transactions_100.csv");
    REQUIRE(dataset_path(".", 500, "json").filename() == "transactions_500.json");
}

TEST_CASE("A run writes and verifies every dataset", "[txngen::process]")
{
    TempDir dir;
    GeneratorOptions options;
    options.output_directory = (dir.path() / "nested").string();
    options.sizes = { 0, 5, 12 };
    options.seed = 31;
    options.verify = true;

    auto files = process(options);

    REQUIRE(files.size() == 6);
    REQUIRE(files[0].filename() == "transactions_0.csv");
    REQUIRE(files[5].filename() == "transactions_12.json");
    for (const auto& file : files)
        REQUIRE(fs::is_regular_file(file));

    REQUIRE(readers::read_csv(files[2]).size() == 12);
    REQUIRE(readers::read_json(files[4]).size() == 5);
}

TEST_CASE("A run can skip a format", "[txngen::process]")
{
    TempDir dir;
    GeneratorOptions options;
    options.output_directory = dir.path().string();
    options.sizes = { 3 };
    options.seed = 32;
    options.write_json = false;
    options.checksum_mode = ChecksumMode::Legacy;
    options.verify = true;

    auto files = process(options);

    REQUIRE(files.size() == 1);
    REQUIRE(files.front().extension() == ".csv");
    REQUIRE_FALSE(fs::exists(dir.path() / "transactions_3.json"));
}

TEST_CASE("A run refuses an output path that is a file", "[txngen::process]")
{
    TempDir dir;
    auto file = dir.path() / "occupied";
    std::ofstream{file} << "x";

    GeneratorOptions options;
    options.output_directory = file.string();

    REQUIRE_THROWS_AS(process(options), std::invalid_argument);
}

TEST_CASE("Verification catches a file that doesn't match", "[txngen::process]")
{
    TempDir dir;
    generation::Context context{33};
    auto transactions = generation::generate_transactions(4, context);

    auto file = dir.path() / "transactions_4.csv";
    writers::write_csv(transactions, file);
    REQUIRE_NOTHROW(verify_dataset(file, transactions, ChecksumMode::Strict));

    transactions.pop_back();
    REQUIRE_THROWS_AS(verify_dataset(file, transactions, ChecksumMode::Strict), std::runtime_error);
}

TEST_CASE("Verification problems go to the stderr logger", "[txngen::process]")
{
    TempDir dir;
    generation::Context context{34};
    auto transactions = generation::generate_transactions(2, context);
    auto file = dir.path() / "transactions_2.json";
    writers::write_json(transactions, file);
    transactions.front().cvv = "x";

    std::ostringstream captured;
    spdlog::drop("stderr");
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    spdlog::register_logger(std::make_shared<spdlog::logger>("stderr", sink));

    REQUIRE(error_logger() == spdlog::get("stderr"));
    REQUIRE_THROWS_AS(verify_dataset(file, transactions, ChecksumMode::Strict), std::runtime_error);
    spdlog::drop("stderr");

    REQUIRE(captured.str().find("record 1") != std::string::npos);
    REQUIRE(captured.str().find("transactions_2.json") != std::string::npos);
    REQUIRE(error_logger() == spdlog::default_logger());
}
