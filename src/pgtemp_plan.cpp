/**
 * @file pgtemp_plan.cpp
 * @brief pgtemp-plan: build and print the resources for a throwaway Postgres.
 *
 * ## Usage
 *
 *     pgtemp-plan                                  # Defaults: temporary dirs, free port
 *     pgtemp-plan --config base.json --config ci.json
 *     pgtemp-plan --config base.json --keep        # Leave the directories in place
 *
 * Config files are layered in the order given; PGTEMP_PORT, PGTEMP_TEMP_DIR,
 * PGTEMP_DATA_DIR and PGTEMP_SOCKET_DIR from the environment are applied on
 * top. The completed resources are printed as JSON on stdout and then
 * released, unless --keep is given.
 *
 * Exit status: 0 success, 1 setup or config failure, 2 usage error.
 */

#include "pgt_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace pgtemp;
using namespace pgtemp::config;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

constexpr int kExitUsage = 2;

struct PlanArgs
{
    std::vector<std::string> config_paths;
    std::string log_level{"warn"};
    std::string log_file;
    bool keep{false};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [--config <path.json>]... [--keep] [--log-level <level>] [--log-file <path>]\n\n"
        << "Options:\n"
        << "  --config <path>     JSON config layer; may be repeated, later files win\n"
        << "  --keep              Do not remove the temporary directories afterwards\n"
        << "  --log-level <lvl>   trace, debug, info, warn, error or system (default: warn)\n"
        << "  --log-file <path>   Append log lines to a file instead of stderr\n"
        << "  --help              Show this message\n";
}

PlanArgs parse_args(int argc, char *argv[])
{
    PlanArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_paths.emplace_back(argv[++i]);
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            args.log_level = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            args.log_file = argv[++i];
        }
        else if (arg == "--keep")
        {
            args.keep = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(kExitUsage);
        }
    }
    return args;
}

void configure_logger(const PlanArgs &args)
{
    auto &logger = utils::Logger::instance();
    try
    {
        logger.set_level(utils::parse_level(args.log_level));
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n\n";
        print_usage("pgtemp-plan");
        std::exit(kExitUsage);
    }
    if (!args.log_file.empty() && !logger.set_logfile(args.log_file))
    {
        std::cerr << "Error: cannot open log file '" << args.log_file << "'\n";
        std::exit(kExitUsage);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const PlanArgs args = parse_args(argc, argv);
    configure_logger(args);

    try
    {
        // ── Assemble the config layers ────────────────────────────────────────
        const NullDevice null_device;
        Config config;
        for (const auto &path : args.config_paths)
        {
            config = combine(config, load_config_file(path, &null_device));
        }
        config = combine(config, environment_overrides(platform::environment_snapshot()));
        PGTEMP_LOG_DEBUG("pgtemp-plan: effective config:\n{}", render_config(config));

        // ── Acquire ───────────────────────────────────────────────────────────
        ResourcesGuard guard(setup_config(config));
        std::cout << render_resources(guard.get()) << std::endl;

        if (args.keep)
        {
            const Resources kept = guard.release();
            std::cerr << "Keeping socket directory " << kept.socket_directory.path().string()
                      << " and data directory " << kept.data_directory.path().string() << "\n";
        }
        else
        {
            guard.cleanup();
        }
    }
    catch (const CompletePlanFailed &ex)
    {
        std::cerr << "Error: the plan is incomplete:\n";
        for (const auto &err : ex.errors())
        {
            std::cerr << "  " << err << "\n";
        }
        std::cerr << "Plan as merged:\n" << ex.rendered_plan() << "\n";
        return 1;
    }
    catch (const ConfigFileError &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    utils::Logger::instance().flush();
    return 0;
}
