#pragma once

#include <string>
#include <vector>

struct MigrationPlan;
class MigrationDestination;
enum class SessionState;

struct DeviceProgress {
    std::string targetDevice;
    unsigned int percent{0};
    bool complete{false};
};

// Destination of one pending device, as shown before confirmation.
struct PlannedCopy {
    std::string targetDevice;
    std::string source;            // current file path or pool/volume
    std::string destination;       // destination file path or pool/volume
    std::string destinationXml;
};

/**
 * @brief Receives what a migration session does, for display or logging
 *
 * All callbacks run on the session thread. Default implementations ignore
 * the event so observers override only what they show.
 */
class IMigrationObserver {
public:
    virtual ~IMigrationObserver() = default;

    virtual void onStateChanged(SessionState /*from*/, SessionState /*to*/) {}

    virtual void onPlanReady(const std::string& /*domainName*/,
                             const MigrationDestination& /*destination*/,
                             const MigrationPlan& /*plan*/,
                             const std::vector<PlannedCopy>& /*copies*/) {}

    virtual void onResume(const std::vector<std::string>& /*ongoingDevices*/) {}

    // One call per poll tick with every monitored device.
    virtual void onProgress(const std::vector<DeviceProgress>& /*progress*/) {}

    virtual void onBackupWritten(const std::string& /*path*/) {}
};

/**
 * @brief Asks the operator before the first destructive step
 */
class IOperatorPrompt {
public:
    virtual ~IOperatorPrompt() = default;

    [[nodiscard]] virtual bool confirm(const std::string& question) = 0;
};
