#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "options.hpp"
#include "txngen.hpp"

int main(int argc, const char** argv)
{
    // Progress goes to stdout, failures to stderr
    auto console = spdlog::stdout_color_mt("console");
    spdlog::stderr_color_mt("stderr");
    console->set_pattern("%v");

    try
    {
        auto opts = txngen::parse_options(argc, argv);
        console->set_level(spdlog::level::from_str(opts.log_level));

        txngen::process(opts);
    }
    catch (const std::exception& e)
    {
        txngen::error_logger()->error("ERROR: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
