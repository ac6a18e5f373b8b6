#include "Virtualization/vm/VolumeDescriptor.hpp"

const std::string& VolumeDescriptor::location() const noexcept {
    if (const auto* file = std::get_if<FileBacked>(&backing)) return file->directory;
    return std::get<PoolBacked>(backing).poolName;
}

const std::string& VolumeDescriptor::leafName() const noexcept {
    if (const auto* file = std::get_if<FileBacked>(&backing)) return file->fileName;
    return std::get<PoolBacked>(backing).volumeName;
}

std::string VolumeDescriptor::describe() const {
    if (const auto* file = std::get_if<FileBacked>(&backing)) {
        if (file->directory == "/") return "/" + file->fileName;
        return file->directory + "/" + file->fileName;
    }
    const auto& pool = std::get<PoolBacked>(backing);
    return pool.poolName + "/" + pool.volumeName;
}
