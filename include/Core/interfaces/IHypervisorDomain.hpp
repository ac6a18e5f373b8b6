#pragma once

#include <optional>
#include <string>

/**
 * @brief Progress counters of a running block job, as reported by the hypervisor
 */
struct BlockJobStatus {
    unsigned long long cur{0};
    unsigned long long end{0};

    // Finished when the mirror has caught up. A job libvirt has only just
    // started can report 0/0, which also counts as finished here; the pivot
    // then fails as "not ready" and a re-run resumes the job.
    [[nodiscard]] bool isComplete() const noexcept { return cur >= end; }

    // floor(100 * cur / end), 100 once complete.
    [[nodiscard]] unsigned int percent() const noexcept {
        if (isComplete()) return 100;
        return static_cast<unsigned int>(cur * 100 / end);
    }
};

/**
 * @brief The hypervisor operations a storage migration needs on one domain
 *
 * Every call is synchronous. Failures are reported as
 * HypervisorOperationException; implementations never retry.
 */
class IHypervisorDomain {
public:
    virtual ~IHypervisorDomain() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Persistent definition, or the live one when the domain is transient.
    [[nodiscard]] virtual std::string xmlDescription() = 0;

    [[nodiscard]] virtual bool isPersistent() = 0;

    /// Status of the block job on @p targetDevice; std::nullopt when none is running.
    [[nodiscard]] virtual std::optional<BlockJobStatus> blockJobInfo(const std::string& targetDevice) = 0;

    /// Starts mirroring @p targetDevice into the disk described by @p destinationXml. Returns immediately.
    virtual void blockCopy(const std::string& targetDevice, const std::string& destinationXml) = 0;

    /// Switches @p targetDevice over to its mirror and ends the job. Irreversible.
    virtual void blockJobPivot(const std::string& targetDevice) = 0;

    /// Removes the persistent definition, keeping the NVRAM file association.
    virtual void undefineKeepNvram() = 0;

    /// Makes @p xml the persistent definition of this domain.
    virtual void define(const std::string& xml) = 0;
};
