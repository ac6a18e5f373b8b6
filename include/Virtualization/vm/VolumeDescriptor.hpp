#pragma once
#include <map>
#include <string>
#include <variant>

// Disk backed by a plain image file: <source file='directory/fileName'/>
struct FileBacked {
    std::string directory;
    std::string fileName;
};

// Disk backed by a libvirt storage pool volume: <source pool='...' volume='...'/>
struct PoolBacked {
    std::string poolName;
    std::string volumeName;
};

struct VolumeDescriptor {
    std::string targetDevice;                   // vda, sdb, ...
    std::variant<FileBacked, PoolBacked> backing;

    [[nodiscard]] bool isFileBacked() const noexcept { return std::holds_alternative<FileBacked>(backing); }
    [[nodiscard]] bool isPoolBacked() const noexcept { return std::holds_alternative<PoolBacked>(backing); }

    // Directory for file-backed disks, pool name for pool-backed ones.
    [[nodiscard]] const std::string& location() const noexcept;

    // File name or volume name; the disk keeps this name at its destination.
    [[nodiscard]] const std::string& leafName() const noexcept;

    // "/data/pool-a/web01.qcow2" or "fast-ssd/web01.qcow2"
    [[nodiscard]] std::string describe() const;
};

// Keyed by target device.
using VolumeMap = std::map<std::string, VolumeDescriptor>;
