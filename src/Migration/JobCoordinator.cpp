#include "Migration/JobCoordinator.hpp"
#include "Virtualization/builder/DiskDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>
#include <vector>

JobCoordinator::JobCoordinator(IHypervisorDomain& domain, CONCURRENCY::PollScheduler& scheduler,
                               IMigrationObserver* observer)
    : domain(domain), scheduler(scheduler), observer(observer) {}

void JobCoordinator::launch(const VolumeDescriptor& volume, const MigrationDestination& destination,
                            const std::string& format) {
    std::string xml = DiskDefinitionBuilder{}
                          .setDestination(destination)
                          .forVolume(volume)
                          .setFormat(format)
                          .build();

    BoostLogger::Info("Starting block copy of ", volume.targetDevice, " (", volume.describe(), ") to ",
                      destination.describe());
    domain.blockCopy(volume.targetDevice, xml);
    progress[volume.targetDevice] = DeviceProgress{volume.targetDevice, 0, false};
}

bool JobCoordinator::pollOnce(const std::set<std::string>& devices) {
    bool allComplete = true;
    std::vector<DeviceProgress> tick;
    tick.reserve(devices.size());

    for (const auto& device : devices) {
        auto& entry = progress[device];
        entry.targetDevice = device;

        if (!entry.complete) {
            auto job = domain.blockJobInfo(device);
            if (!job || job->isComplete()) {
                entry.complete = true;
                entry.percent = 100;
                BoostLogger::Info("Block copy of ", device, " is complete");
            } else {
                // Mirror counters may step back while the guest writes; never report a regression.
                entry.percent = std::max(entry.percent, job->percent());
                BoostLogger::Trace("Block copy of ", device, ": ", job->cur, "/", job->end);
            }
        }

        allComplete = allComplete && entry.complete;
        tick.push_back(entry);
    }

    if (observer) observer->onProgress(tick);
    return allComplete;
}

void JobCoordinator::monitorAll(const std::set<std::string>& devices) {
    if (devices.empty()) return;
    std::size_t ticks = scheduler.runUntil([this, &devices]() { return pollOnce(devices); });
    BoostLogger::Info("All ", devices.size(), " block copies complete after ", ticks, " poll(s)");
}

void JobCoordinator::pivotAll(const std::set<std::string>& devices) {
    for (const auto& device : devices) {
        if (!isComplete(device)) {
            throw HypervisorOperationException("pivot " + device, "block copy has not been observed complete");
        }
    }
    for (const auto& device : devices) {
        BoostLogger::Info("Pivoting ", device, " to its new location");
        domain.blockJobPivot(device);
    }
}

unsigned int JobCoordinator::reportedPercent(const std::string& device) const {
    auto it = progress.find(device);
    return it == progress.end() ? 0 : it->second.percent;
}

bool JobCoordinator::isComplete(const std::string& device) const {
    auto it = progress.find(device);
    return it != progress.end() && it->second.complete;
}
