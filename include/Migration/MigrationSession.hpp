#pragma once
#include "Core/concurrency/PollScheduler.hpp"
#include "Core/interfaces/IHypervisorDomain.hpp"
#include "Core/interfaces/IMigrationObserver.hpp"
#include "Migration/MigrationPartitioner.hpp"
#include "Virtualization/vmm/MigrationConfig.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

enum class SessionState {
    Inspect,
    Plan,
    ResumeMonitor,
    Pivot,
    ConfirmDestructive,
    Backup,
    Undefine,
    LaunchAll,
    MonitorAll,
    PivotAll,
    Redefine,
    Done,
    Aborted
};

const char* toString(SessionState state) noexcept;

/**
 * @brief One run of a live storage migration for one domain
 *
 * Inspect -> Plan -> (Done | Redefine | ResumeMonitor -> Pivot | ConfirmDestructive)
 * ConfirmDestructive -> Backup -> Undefine -> LaunchAll -> MonitorAll -> PivotAll
 * -> Redefine -> Done. Every failure ends in Aborted and rethrows; the next run
 * picks up jobs left behind through the ResumeDetector.
 */
class MigrationSession {
public:
    MigrationSession(MigrationConfig config,
                     std::shared_ptr<IHypervisorDomain> domain,
                     std::shared_ptr<IOperatorPrompt> prompt,
                     std::shared_ptr<CONCURRENCY::IPollClock> clock,
                     std::shared_ptr<IMigrationObserver> observer = nullptr);

    MigrationSession(const MigrationSession&) = delete;
    MigrationSession& operator=(const MigrationSession&) = delete;

    // Runs to Done or throws after moving to Aborted. Single use.
    SessionState run();

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    // State the session was in when it aborted; meaningful only once Aborted.
    [[nodiscard]] SessionState failedIn() const noexcept { return failedIn_; }
    [[nodiscard]] const MigrationPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] const VolumeMap& volumes() const noexcept { return volumes_; }
    [[nodiscard]] bool resumed() const noexcept { return resumed_; }

private:
    MigrationConfig config_;
    std::shared_ptr<IHypervisorDomain> domain_;
    std::shared_ptr<IOperatorPrompt> prompt_;
    std::shared_ptr<CONCURRENCY::IPollClock> clock_;
    std::shared_ptr<IMigrationObserver> observer_;

    SessionState state_{SessionState::Inspect};
    SessionState failedIn_{SessionState::Inspect};
    bool resumed_{false};

    std::string originalXml_;
    VolumeMap volumes_;
    MigrationPlan plan_;
    std::set<std::string> ongoing_;

    void transition(SessionState next);
    void execute();

    void inspect();
    void planMigration();
    [[nodiscard]] std::vector<PlannedCopy> describeCopies() const;
    void confirmDestructive();
    void writeBackup();
    void undefine();
    void redefine();
};
