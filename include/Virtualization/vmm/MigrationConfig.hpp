#ifndef MIGRATIONCONFIG_H
#define MIGRATIONCONFIG_H

#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Where the disks go: a storage pool or a directory, never both.
class MigrationDestination {
public:
    enum class Kind { Pool, FilePath };

    // Throws InvalidDestinationException unless exactly one of the two is set
    // and non-empty. A file path must be absolute.
    static MigrationDestination fromOptions(const std::optional<std::string>& pool,
                                            const std::optional<std::string>& filePath);
    static MigrationDestination toPool(const std::string& pool);
    static MigrationDestination toFilePath(const std::string& path);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isPool() const noexcept { return kind_ == Kind::Pool; }
    [[nodiscard]] bool isFilePath() const noexcept { return kind_ == Kind::FilePath; }

    // Pool name, or the lexically normalized directory without trailing separator.
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    [[nodiscard]] std::string describe() const;

private:
    MigrationDestination(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_;
    std::string value_;
};

// Normalizes a directory for comparison: resolves "." and "..", drops the
// trailing separator. "/data//pool-b/./" -> "/data/pool-b".
std::string normalizeDirectory(const std::string& path);

struct ConnectionConfig {
    std::string host;          // empty: local hypervisor
    std::string user;
    bool ssh{false};
    std::string session{"system"};

    // qemu[+ssh]://[user@]host/session
    [[nodiscard]] std::string toUri() const;
};

struct MigrationConfig {
    std::string domainName;
    MigrationDestination destination;

    std::string diskFormat{"qcow2"};
    std::string backupDirectory{"/tmp"};
    std::chrono::milliseconds pollInterval{std::chrono::seconds(1)};
    bool assumeYes{false};

    // <backupDirectory>/<domainName>_backup.xml
    [[nodiscard]] std::string backupPath() const;

    // Throws VmException describing the first invalid field.
    void validate() const;
};

#endif // MIGRATIONCONFIG_H
