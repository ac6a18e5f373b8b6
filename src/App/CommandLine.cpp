#include "App/CommandLine.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <boost/program_options.hpp>
#include <chrono>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

Result<CommandLineOptions> parseCommandLine(const std::vector<std::string>& args) {
    po::options_description generic("Options");
    generic.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(), "read missing options from this INI file")
        ("yes,y", po::bool_switch(), "do not ask for confirmation");

    po::options_description migration("Migration");
    migration.add_options()
        ("pool", po::value<std::string>(), "destination storage pool")
        ("filepath", po::value<std::string>(), "destination directory (absolute)")
        ("format", po::value<std::string>()->default_value("qcow2"), "destination disk format")
        ("backup-dir", po::value<std::string>()->default_value("/tmp"), "where <domain>_backup.xml is written")
        ("poll-interval", po::value<long>()->default_value(1000), "block job poll interval in milliseconds");

    po::options_description connection("Connection");
    connection.add_options()
        ("host", po::value<std::string>()->default_value(""), "hypervisor host, empty for local")
        ("user", po::value<std::string>(), "user for the connection")
        ("ssh", po::value<bool>()->default_value(false)->implicit_value(true), "connect over ssh")
        ("session", po::value<std::string>()->default_value("system"), "libvirt session: system or session");

    po::options_description logging("Logging");
    logging.add_options()
        ("log-file", po::value<std::string>()->default_value("/tmp/livestor.log"), "log file")
        ("log-level", po::value<std::string>()->default_value("warning"), "console log level")
        ("verbose,v", po::value<bool>()->default_value(false)->implicit_value(true), "same as --log-level debug");

    po::options_description hidden;
    hidden.add_options()("domain", po::value<std::string>(), "domain name");

    po::options_description visible;
    visible.add(generic).add(migration).add(connection).add(logging);
    po::options_description all;
    all.add(visible).add(hidden);
    po::options_description fromFile;
    fromFile.add(migration).add(connection).add(logging);

    po::positional_options_description positional;
    positional.add("domain", 1);

    std::ostringstream usage;
    usage << "Usage: livestor <domain> (--pool NAME | --filepath DIR) [options]\n" << visible;

    CommandLineOptions options;
    options.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                return Result<CommandLineOptions>{std::string("cannot read config file \"" + path + "\"")};
            }
            po::store(po::parse_config_file(file, fromFile), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        return Result<CommandLineOptions>{std::string(e.what())};
    }

    if (vm.count("help")) {
        options.showHelp = true;
        return Result<CommandLineOptions>{std::move(options)};
    }
    if (!vm.count("domain")) {
        return Result<CommandLineOptions>{std::string("missing domain name")};
    }

    std::optional<std::string> pool;
    std::optional<std::string> filePath;
    if (vm.count("pool")) pool = vm["pool"].as<std::string>();
    if (vm.count("filepath")) filePath = vm["filepath"].as<std::string>();

    MigrationConfig config{vm["domain"].as<std::string>(), MigrationDestination::fromOptions(pool, filePath)};
    config.diskFormat = vm["format"].as<std::string>();
    config.backupDirectory = vm["backup-dir"].as<std::string>();
    config.pollInterval = std::chrono::milliseconds(vm["poll-interval"].as<long>());
    config.assumeYes = vm["yes"].as<bool>();
    options.migration = std::move(config);

    options.connection.host = vm["host"].as<std::string>();
    if (vm.count("user")) options.connection.user = vm["user"].as<std::string>();
    options.connection.ssh = vm["ssh"].as<bool>();
    options.connection.session = vm["session"].as<std::string>();

    options.logging.file_path = vm["log-file"].as<std::string>();
    options.logging.console_level = vm["verbose"].as<bool>()
        ? BoostLogger::Level::Debug
        : BoostLogger::parseLevel(vm["log-level"].as<std::string>(), BoostLogger::Level::Warning);

    return Result<CommandLineOptions>{std::move(options)};
}

std::optional<int> loadCommandLine(const std::vector<std::string>& args, CommandLineOptions& options,
                                   std::ostream& out, std::ostream& err) {
    try {
        auto parsed = parseCommandLine(args);
        if (parsed.isErr()) {
            err << "livestor: " << parsed.unwrapErr() << "\n";
            return 2;
        }
        options = parsed.unwrap();
    } catch (const VmException& e) {
        err << "livestor: " << e.what() << "\n";
        return e.exitCode();
    }
    if (options.showHelp) {
        out << options.usage;
        return 0;
    }
    return std::nullopt;
}
