#include "Virtualization/vmm/MigrationConfig.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

std::string normalizeDirectory(const std::string& path) {
    if (path.empty()) return path;
    fs::path normal = fs::path(path).lexically_normal();
    // "/a/b/" normalizes to "/a/b/" (empty filename); strip it but keep "/".
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal.string();
}

MigrationDestination MigrationDestination::fromOptions(const std::optional<std::string>& pool,
                                                       const std::optional<std::string>& filePath) {
    if (pool.has_value() == filePath.has_value()) {
        throw InvalidDestinationException("Either a pool or a file path must be specified (but not both)");
    }
    return pool ? toPool(*pool) : toFilePath(*filePath);
}

MigrationDestination MigrationDestination::toPool(const std::string& pool) {
    if (pool.empty()) throw InvalidDestinationException("Destination pool name is empty");
    return MigrationDestination(Kind::Pool, pool);
}

MigrationDestination MigrationDestination::toFilePath(const std::string& path) {
    if (path.empty()) throw InvalidDestinationException("Destination file path is empty");
    if (!fs::path(path).is_absolute()) {
        throw InvalidDestinationException("Destination file path must be absolute: " + path);
    }
    return MigrationDestination(Kind::FilePath, normalizeDirectory(path));
}

std::string MigrationDestination::describe() const {
    return (isPool() ? "pool " : "directory ") + value_;
}

std::string ConnectionConfig::toUri() const {
    std::ostringstream uri;
    uri << "qemu" << (ssh ? "+ssh" : "") << "://";
    if (!user.empty()) uri << user << "@";
    uri << host << "/" << session;
    return uri.str();
}

std::string MigrationConfig::backupPath() const {
    return (fs::path(backupDirectory) / (domainName + "_backup.xml")).string();
}

void MigrationConfig::validate() const {
    if (domainName.empty()) throw VmException("Domain name is empty");
    if (diskFormat.empty()) throw VmException("Destination disk format is empty");
    if (backupDirectory.empty()) throw VmException("Backup directory is empty");
    if (pollInterval.count() <= 0) throw VmException("Poll interval must be positive");
}
