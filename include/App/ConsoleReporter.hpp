#pragma once
#include "Core/interfaces/IMigrationObserver.hpp"
#include <iosfwd>
#include <string>
#include <vector>

// Prints the plan and live progress for the operator and asks for confirmation.
class ConsoleReporter : public IMigrationObserver, public IOperatorPrompt {
public:
    ConsoleReporter(std::ostream& out, std::istream& in);

    void onStateChanged(SessionState from, SessionState to) override;
    void onPlanReady(const std::string& domainName,
                     const MigrationDestination& destination,
                     const MigrationPlan& plan,
                     const std::vector<PlannedCopy>& copies) override;
    void onResume(const std::vector<std::string>& ongoingDevices) override;
    void onProgress(const std::vector<DeviceProgress>& progress) override;
    void onBackupWritten(const std::string& path) override;

    [[nodiscard]] bool confirm(const std::string& question) override;

private:
    std::ostream& out;
    std::istream& in;
    bool progressLineOpen{false};

    void closeProgressLine();
};
