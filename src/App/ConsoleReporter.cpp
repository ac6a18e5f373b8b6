#include "App/ConsoleReporter.hpp"
#include "Migration/MigrationSession.hpp"
#include <istream>
#include <ostream>

namespace {
const char* const SEPARATOR = "----------";
}

ConsoleReporter::ConsoleReporter(std::ostream& out, std::istream& in) : out(out), in(in) {}

void ConsoleReporter::onStateChanged(SessionState from, SessionState to) {
    if (from == SessionState::MonitorAll || from == SessionState::ResumeMonitor) {
        closeProgressLine();
    }
    if (to == SessionState::Done) {
        out << "Complete!" << std::endl;
    }
}

void ConsoleReporter::onPlanReady(const std::string& domainName,
                                  const MigrationDestination& destination,
                                  const MigrationPlan& plan,
                                  const std::vector<PlannedCopy>& copies) {
    out << "\nWhat will happen:\n" << SEPARATOR << "\n\n";
    out << "Domain name:\n" << SEPARATOR << "\n" << domainName << "\n" << SEPARATOR << "\n\n";
    out << "Destination: " << destination.describe() << "\n\n";

    out << "Volumes:\n" << SEPARATOR << "\n";
    for (const auto& copy : copies) {
        const auto& volume = plan.pending.at(copy.targetDevice);
        out << "Target dev: " << copy.targetDevice << "\n";
        if (volume.isFileBacked()) {
            out << "File path: " << copy.source << "\n";
        } else {
            const auto& pool = std::get<PoolBacked>(volume.backing);
            out << "Volume Pool: " << pool.poolName << " -- Volume Name: " << pool.volumeName << "\n";
        }
        if (destination.isFilePath()) {
            out << "Destination file path: " << copy.destination << "\n";
        } else {
            out << "Destination pool: " << destination.value() << "\n";
        }
        out << "Destination XML: " << copy.destinationXml << "\n";
        out << SEPARATOR << "\n";
    }

    if (!plan.alreadyMigrated.empty()) {
        out << "\nAlready at destination:\n" << SEPARATOR << "\n";
        for (const auto& [device, volume] : plan.alreadyMigrated) {
            out << "Target dev: " << device << " (" << volume.describe() << ")\n";
        }
        out << SEPARATOR << "\n";
    }

    if (plan.isNoop()) {
        out << "\nNothing to migrate.\n";
    }
    out << std::flush;
}

void ConsoleReporter::onResume(const std::vector<std::string>& ongoingDevices) {
    out << "\nResuming block copies left by a previous run:";
    for (const auto& device : ongoingDevices) out << " " << device;
    out << std::endl;
}

void ConsoleReporter::onProgress(const std::vector<DeviceProgress>& progress) {
    out << "\rMigrating";
    const char* sep = " ";
    for (const auto& device : progress) {
        out << sep << device.targetDevice << " -- " << device.percent << "%";
        sep = " | ";
    }
    out << std::flush;
    progressLineOpen = true;
}

void ConsoleReporter::onBackupWritten(const std::string& path) {
    out << SEPARATOR << "\nBacked up domain XML to local file \"" << path << "\"" << std::endl;
}

bool ConsoleReporter::confirm(const std::string& question) {
    out << "\n" << question << std::flush;
    std::string response;
    if (!std::getline(in, response)) return false;
    return response == "y" || response == "Y" || response == "yes";
}

void ConsoleReporter::closeProgressLine() {
    if (progressLineOpen) {
        out << std::endl;
        progressLineOpen = false;
    }
}
