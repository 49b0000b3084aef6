/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "acquisition/AcquisitionServices.hpp"
#include "acquisition/StrategyRegistry.hpp"
#include "config.h"
#include "services/DetachSupervisor.hpp"
#include "services/DiskInspector.hpp"
#include "services/HashEngine.hpp"
#include "services/PresetPathChooser.hpp"
#include "services/ProcessRunner.hpp"
#include "services/ReportWriter.hpp"
#include "services/SystemFileSystem.hpp"
#include "services/SystemSleeper.hpp"
#include "ui/GtkPathChooser.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <format>
#include <iostream>

#include <getopt.h>

namespace cli {

namespace {

constexpr auto APP_NAME = "fuji-acquire";

enum LongOnly : int {
    OPT_NOTES = 1000,
    OPT_TMP,
    OPT_SNAPSHOT_IMAGE,
    OPT_COPY_TO,
    OPT_NO_KEEP_AWAKE,
    OPT_LIST_METHODS,
};

// Command line options
const struct option long_options[] = {
    {          "help",       no_argument, nullptr,                 'h'},
    {       "version",       no_argument, nullptr,                 'V'},
    {          "case", required_argument, nullptr,                 'c'},
    {      "examiner", required_argument, nullptr,                 'e'},
    {         "notes", required_argument, nullptr,           OPT_NOTES},
    {    "image-name", required_argument, nullptr,                 'n'},
    {        "source", required_argument, nullptr,                 's'},
    {           "tmp", required_argument, nullptr,             OPT_TMP},
    {   "destination", required_argument, nullptr,                 'd'},
    {        "method", required_argument, nullptr,                 'm'},
    {"snapshot-image", required_argument, nullptr,  OPT_SNAPSHOT_IMAGE},
    {       "copy-to", required_argument, nullptr,         OPT_COPY_TO},
    { "no-keep-awake",       no_argument, nullptr,   OPT_NO_KEEP_AWAKE},
    {  "list-methods",       no_argument, nullptr,    OPT_LIST_METHODS},
    {       "verbose",       no_argument, nullptr,                 'v'},
    {         nullptr,                 0, nullptr,                   0}
};

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "fuji" / "logs";
    util::Logger::instance().initialize(log_dir, APP_NAME);

    auto options = parse_args(argc, argv);

    if (options.invalid) {
        print_help();
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.verbose) {
        util::Logger::instance().set_min_level(util::LogLevel::DEBUG);
        util::Logger::instance().set_console_output(true);
    }

    if (options.list_methods) {
        return cmd_list_methods();
    }

    return cmd_acquire(options);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 1;
    int opt;
    while ((opt = getopt_long(argc, argv, "hVc:e:n:s:d:m:v", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'c':
                options.params.case_name = optarg;
                break;
            case 'e':
                options.params.examiner = optarg;
                break;
            case OPT_NOTES:
                options.params.notes = optarg;
                break;
            case 'n':
                options.params.image_name = optarg;
                break;
            case 's':
                options.params.source = optarg;
                break;
            case OPT_TMP:
                options.params.tmp = optarg;
                break;
            case 'd':
                options.params.destination = optarg;
                break;
            case 'm':
                options.method = optarg;
                break;
            case OPT_SNAPSHOT_IMAGE:
                options.snapshot_image = std::filesystem::path{optarg};
                break;
            case OPT_COPY_TO:
                options.copy_to = std::filesystem::path{optarg};
                break;
            case OPT_NO_KEEP_AWAKE:
                options.keep_awake = false;
                break;
            case OPT_LIST_METHODS:
                options.list_methods = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    if (optind < argc) {
        options.invalid = true;
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Forensic acquisition of a source volume into verifiable images\n\n"
              << "Case details:\n"
              << "  -c, --case <name>           Case name recorded in the report\n"
              << "  -e, --examiner <name>       Examiner recorded in the report\n"
              << "      --notes <text>          Free-form notes recorded in the report\n"
              << "  -n, --image-name <name>     Base name of images and report (default: "
                 "FujiAcquisition)\n\n"
              << "Locations:\n"
              << "  -s, --source <path>         Path to acquire (default: /)\n"
              << "      --tmp <dir>             Temporary working area (default: /Volumes/Fuji)\n"
              << "  -d, --destination <dir>     Where images and the report go "
                 "(default: /Volumes/Fuji)\n\n"
              << "Acquisition:\n"
              << "  -m, --method <id>           Acquisition method (default: snapshot)\n"
              << "      --snapshot-image <file> Use this image instead of asking for one\n"
              << "      --copy-to <dir>         Copy here instead of asking for a folder\n"
              << "      --no-keep-awake         Do not keep the machine awake during long steps\n"
              << "      --list-methods          List available acquisition methods\n\n"
              << "Options:\n"
              << "  -v, --verbose               Log debug output to stderr\n"
              << "  -h, --help                  Show this help message\n"
              << "  -V, --version               Show version information\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --case CASE1 --examiner Alice --destination /Volumes/Evidence\n"
              << "  " << APP_NAME << " --snapshot-image /Volumes/Fuji/snap.dmg --copy-to /tmp/out\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of Fuji - Forensic Unattended Juicy Imaging\n";
}

auto CliApplication::cmd_list_methods() -> int {
    ToolCommands tools;
    ProcessRunner runner{tools.keep_awake};
    SystemFileSystem filesystem;
    SystemSleeper sleeper;
    DiskInspector inspector{runner, filesystem, tools};
    PresetPathChooser chooser{std::nullopt, std::nullopt};
    DetachSupervisor supervisor{runner, sleeper, tools};
    HashEngine hash_engine;
    ReportWriter report_writer;
    AcquisitionServices services{runner,      inspector,     chooser, supervisor,
                                 hash_engine, report_writer, tools};

    const auto registry = acquisition::StrategyRegistry::with_builtin_strategies();
    for (const auto& identifier : registry.identifiers()) {
        auto strategy = registry.create(identifier, services);
        std::cout << std::format("  {:<12}{}\n", identifier, strategy->get_name())
                  << std::format("  {:<12}{}\n", "", strategy->get_description());
    }
    return 0;
}

auto CliApplication::cmd_acquire(const CliOptions& options) -> int {
    ToolCommands tools;
    ProcessRunner runner{options.keep_awake ? tools.keep_awake : std::vector<std::string>{}};
    SystemFileSystem filesystem;
    SystemSleeper sleeper;
    DiskInspector inspector{runner, filesystem, tools};
    GtkPathChooser dialogs;
    PresetPathChooser chooser{options.snapshot_image, options.copy_to, &dialogs};
    DetachSupervisor supervisor{runner, sleeper, tools};
    HashEngine hash_engine;
    ReportWriter report_writer;
    AcquisitionServices services{runner,      inspector,     chooser, supervisor,
                                 hash_engine, report_writer, tools};

    const auto registry = acquisition::StrategyRegistry::with_builtin_strategies();
    auto strategy = registry.create(options.method, services);
    if (!strategy) {
        LOG_ERROR("CLI", std::format("Unknown acquisition method: {}", options.method));
        std::cerr << "Error: Unknown acquisition method '" << options.method << "'\n"
                  << "Run with --list-methods to see available methods.\n";
        return 1;
    }

    const auto& params = options.params;
    const auto session_log =
        params.destination / params.image_name / (params.image_name + ".log");
    if (!util::Logger::instance().begin_session(session_log)) {
        LOG_WARNING("CLI", std::format("Cannot write session log {}", session_log.string()));
    }

    LOG_INFO("CLI", std::format("Starting {} acquisition of {} (case '{}', examiner '{}')",
                                strategy->get_name(), params.source.string(), params.case_name,
                                params.examiner));

    const auto report = strategy->execute(params);

    LOG_INFO("CLI", std::format("Acquisition {}", report.success ? "succeeded" : "failed"));
    util::Logger::instance().end_session();

    if (!report.success) {
        std::cerr << "Acquisition did not complete. See " << session_log.string()
                  << " for details.\n";
        return 1;
    }

    std::cout << "Report written to " << ReportWriter::report_path(params).string() << "\n";
    return 0;
}

}  // namespace cli
