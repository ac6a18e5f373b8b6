#include "App/CommandLine.hpp"
#include "App/ConsoleReporter.hpp"
#include "Migration/MigrationSession.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

int migrate(const CommandLineOptions& options) {
    const MigrationConfig& config = *options.migration;

    HypervisorConnector connector(options.connection);
    connector.connectOrThrow();
    std::shared_ptr<VirtualMachine> domain = connector.lookupDomain(config.domainName);

    auto console = std::make_shared<ConsoleReporter>(std::cout, std::cin);
    MigrationSession session(config, domain, console, std::make_shared<CONCURRENCY::SteadyPollClock>(), console);
    try {
        session.run();
    } catch (const VmException&) {
        // Undefine and everything after it only happen once the backup exists.
        if (session.failedIn() > SessionState::Backup) {
            std::cerr << "Original domain XML was saved to \"" << config.backupPath() << "\"\n";
        }
        throw;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CommandLineOptions options;
    if (auto exitCode = loadCommandLine(std::vector<std::string>(argv + 1, argv + argc), options, std::cout, std::cerr)) {
        return *exitCode;
    }

    BoostLogger::Init(options.logging);
    try {
        return migrate(options);
    } catch (const OperatorDeclinedException& e) {
        BoostLogger::Info(e.what());
        std::cerr << "Aborted: " << e.what() << "\n";
        return e.exitCode();
    } catch (const VmException& e) {
        BoostLogger::Error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return e.exitCode();
    } catch (const std::exception& e) {
        BoostLogger::Critical(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
