#include "Migration/MigrationPartitioner.hpp"
#include "Utils/Logger.hpp"

std::set<std::string> MigrationPlan::pendingDevices() const {
    std::set<std::string> devices;
    for (const auto& [device, volume] : pending) devices.insert(device);
    return devices;
}

bool MigrationPartitioner::isAtDestination(const VolumeDescriptor& volume, const MigrationDestination& destination) {
    // A pool disk with a directory destination (or the reverse) always moves.
    if (const auto* file = std::get_if<FileBacked>(&volume.backing)) {
        return destination.isFilePath() && normalizeDirectory(file->directory) == destination.value();
    }
    const auto& pool = std::get<PoolBacked>(volume.backing);
    return destination.isPool() && pool.poolName == destination.value();
}

MigrationPlan MigrationPartitioner::partition(const VolumeMap& volumes, const MigrationDestination& destination) {
    MigrationPlan plan;
    for (const auto& [device, volume] : volumes) {
        if (isAtDestination(volume, destination)) {
            plan.alreadyMigrated.emplace(device, volume);
        } else {
            plan.pending.emplace(device, volume);
        }
    }
    BoostLogger::Info("Plan for ", destination.describe(), ": ", plan.pending.size(), " pending, ",
                      plan.alreadyMigrated.size(), " already migrated");
    return plan;
}
