#pragma once
#include "Virtualization/vm/VolumeDescriptor.hpp"
#include "Virtualization/vmm/MigrationConfig.hpp"
#include <set>
#include <string>

struct MigrationPlan {
    VolumeMap pending;           // location differs from the destination
    VolumeMap alreadyMigrated;   // already at the destination

    [[nodiscard]] bool isNoop() const noexcept { return pending.empty(); }
    [[nodiscard]] std::set<std::string> pendingDevices() const;
};

class MigrationPartitioner {
public:
    // Every volume lands in exactly one bucket.
    [[nodiscard]] static MigrationPlan partition(const VolumeMap& volumes, const MigrationDestination& destination);

    [[nodiscard]] static bool isAtDestination(const VolumeDescriptor& volume, const MigrationDestination& destination);
};
