#pragma once
#include "Core/concurrency/PollScheduler.hpp"
#include "Core/interfaces/IHypervisorDomain.hpp"
#include "Core/interfaces/IMigrationObserver.hpp"
#include "Virtualization/vm/VolumeDescriptor.hpp"
#include "Virtualization/vmm/MigrationConfig.hpp"
#include <map>
#include <set>
#include <string>

/**
 * @brief Drives the block-copy jobs of one domain: launch, monitor, pivot
 *
 * Any hypervisor error propagates at once and the remaining devices are not
 * touched. pivotAll() refuses devices that monitorAll() has not seen complete.
 */
class JobCoordinator {
public:
    JobCoordinator(IHypervisorDomain& domain, CONCURRENCY::PollScheduler& scheduler,
                   IMigrationObserver* observer = nullptr);

    // Starts mirroring @p volume to @p destination; does not wait for the copy.
    void launch(const VolumeDescriptor& volume, const MigrationDestination& destination,
                const std::string& format = "qcow2");

    // Polls until every device reports completion. Blocks the caller.
    void monitorAll(const std::set<std::string>& devices);

    void pivotAll(const std::set<std::string>& devices);

    // Highest percentage reported so far for @p device (0 if never polled).
    [[nodiscard]] unsigned int reportedPercent(const std::string& device) const;

    [[nodiscard]] bool isComplete(const std::string& device) const;

private:
    IHypervisorDomain& domain;
    CONCURRENCY::PollScheduler& scheduler;
    IMigrationObserver* observer;

    std::map<std::string, DeviceProgress> progress;

    // One status query per unfinished device; true once all are complete.
    bool pollOnce(const std::set<std::string>& devices);
};
