#pragma once
#include "Utils/Logger.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/vmm/MigrationConfig.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct CommandLineOptions {
    std::optional<MigrationConfig> migration;   // empty when only help was asked for
    ConnectionConfig connection;
    BoostLogger::Config logging;
    bool showHelp{false};
    std::string usage;
};

/**
 * Parses `livestor <domain> (--pool NAME | --filepath DIR) [options]`.
 *
 * Values missing from the command line are read from the INI file named by
 * --config, using the same long option names. Usage errors come back as the
 * error side of the Result; a destination that breaks the pool/filepath
 * exclusivity throws InvalidDestinationException.
 */
[[nodiscard]] Result<CommandLineOptions> parseCommandLine(const std::vector<std::string>& args);

/**
 * Startup step of main(): parses @p args into @p options and handles --help.
 *
 * Returns the exit code when the program should stop here. Problems go to
 * @p err only, since logging is configured from the parsed options.
 */
[[nodiscard]] std::optional<int> loadCommandLine(const std::vector<std::string>& args, CommandLineOptions& options,
                                                 std::ostream& out, std::ostream& err);
