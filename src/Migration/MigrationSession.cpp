#include "Migration/MigrationSession.hpp"
#include "Migration/JobCoordinator.hpp"
#include "Migration/ResumeDetector.hpp"
#include "Migration/VolumeInventory.hpp"
#include "Virtualization/builder/DiskDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

const char* toString(SessionState state) noexcept {
    switch (state) {
        case SessionState::Inspect:            return "Inspect";
        case SessionState::Plan:               return "Plan";
        case SessionState::ResumeMonitor:      return "ResumeMonitor";
        case SessionState::Pivot:              return "Pivot";
        case SessionState::ConfirmDestructive: return "ConfirmDestructive";
        case SessionState::Backup:             return "Backup";
        case SessionState::Undefine:           return "Undefine";
        case SessionState::LaunchAll:          return "LaunchAll";
        case SessionState::MonitorAll:         return "MonitorAll";
        case SessionState::PivotAll:           return "PivotAll";
        case SessionState::Redefine:           return "Redefine";
        case SessionState::Done:               return "Done";
        case SessionState::Aborted:            return "Aborted";
    }
    return "Unknown";
}

MigrationSession::MigrationSession(MigrationConfig config,
                                   std::shared_ptr<IHypervisorDomain> domain,
                                   std::shared_ptr<IOperatorPrompt> prompt,
                                   std::shared_ptr<CONCURRENCY::IPollClock> clock,
                                   std::shared_ptr<IMigrationObserver> observer)
    : config_(std::move(config)),
      domain_(std::move(domain)),
      prompt_(std::move(prompt)),
      clock_(std::move(clock)),
      observer_(std::move(observer))
{
    if (!domain_) throw std::invalid_argument("MigrationSession needs a domain");
    if (!clock_) throw std::invalid_argument("MigrationSession needs a poll clock");
    config_.validate();
}

void MigrationSession::transition(SessionState next) {
    BoostLogger::Debug("Session ", config_.domainName, ": ", toString(state_), " -> ", toString(next));
    SessionState previous = state_;
    state_ = next;
    if (observer_) observer_->onStateChanged(previous, next);
}

SessionState MigrationSession::run() {
    if (state_ != SessionState::Inspect) {
        throw std::logic_error("MigrationSession::run called twice");
    }
    try {
        execute();
    } catch (const std::exception& e) {
        failedIn_ = state_;
        BoostLogger::Error("Migration of ", config_.domainName, " aborted in state ", toString(failedIn_), ": ",
                           e.what());
        transition(SessionState::Aborted);
        throw;
    }
    return state_;
}

void MigrationSession::execute() {
    inspect();
    transition(SessionState::Plan);
    planMigration();

    if (plan_.isNoop()) {
        // An earlier run can be cut off between PivotAll and Redefine; the
        // live description is then already migrated but not persistent.
        if (!domain_->isPersistent()) {
            BoostLogger::Warn("Domain ", config_.domainName, " is transient with every disk migrated; redefining it");
            transition(SessionState::Redefine);
            redefine();
        }
        transition(SessionState::Done);
        return;
    }

    ongoing_ = ResumeDetector::findOngoing(*domain_, plan_.pendingDevices());

    CONCURRENCY::PollScheduler scheduler(config_.pollInterval, clock_);
    JobCoordinator jobs(*domain_, scheduler, observer_.get());

    if (!ongoing_.empty()) {
        resumed_ = true;
        if (observer_) observer_->onResume(std::vector<std::string>(ongoing_.begin(), ongoing_.end()));
        if (ongoing_.size() < plan_.pending.size()) {
            BoostLogger::Warn("Resuming ", ongoing_.size(), " of ", plan_.pending.size(),
                              " pending disk(s); run again afterwards for the rest");
        }
        transition(SessionState::ResumeMonitor);
        jobs.monitorAll(ongoing_);
        transition(SessionState::Pivot);
        jobs.pivotAll(ongoing_);
        transition(SessionState::Redefine);
        redefine();
        transition(SessionState::Done);
        return;
    }

    transition(SessionState::ConfirmDestructive);
    confirmDestructive();

    transition(SessionState::Backup);
    writeBackup();

    transition(SessionState::Undefine);
    undefine();

    const auto devices = plan_.pendingDevices();
    transition(SessionState::LaunchAll);
    for (const auto& [device, volume] : plan_.pending) {
        jobs.launch(volume, config_.destination, config_.diskFormat);
    }

    transition(SessionState::MonitorAll);
    jobs.monitorAll(devices);

    transition(SessionState::PivotAll);
    jobs.pivotAll(devices);

    transition(SessionState::Redefine);
    redefine();

    transition(SessionState::Done);
    BoostLogger::Info("Migration of ", config_.domainName, " complete");
}

void MigrationSession::inspect() {
    originalXml_ = domain_->xmlDescription();
    volumes_ = VolumeInventory::parse(originalXml_);
}

void MigrationSession::planMigration() {
    plan_ = MigrationPartitioner::partition(volumes_, config_.destination);
    if (observer_) observer_->onPlanReady(config_.domainName, config_.destination, plan_, describeCopies());
}

std::vector<PlannedCopy> MigrationSession::describeCopies() const {
    std::vector<PlannedCopy> copies;
    copies.reserve(plan_.pending.size());
    for (const auto& [device, volume] : plan_.pending) {
        DiskDefinitionBuilder builder;
        builder.setDestination(config_.destination).forVolume(volume).setFormat(config_.diskFormat);

        PlannedCopy copy;
        copy.targetDevice = device;
        copy.source = volume.describe();
        copy.destinationXml = builder.build();
        copy.destination = config_.destination.isFilePath()
                               ? builder.destinationFile()
                               : config_.destination.value() + "/" + volume.leafName();
        copies.push_back(std::move(copy));
    }
    return copies;
}

void MigrationSession::confirmDestructive() {
    if (config_.assumeYes) {
        BoostLogger::Info("Confirmation skipped (assume yes)");
        return;
    }
    if (!prompt_ || !prompt_->confirm("Proceed? (y/N): ")) {
        throw OperatorDeclinedException();
    }
}

void MigrationSession::writeBackup() {
    const std::string path = config_.backupPath();

    // A transient domain or a partly migrated one means an earlier run got past
    // Undefine. The file on disk then holds the only pre-migration definition.
    const bool unfinished = !domain_->isPersistent() || !plan_.alreadyMigrated.empty();
    std::error_code ec;
    if (unfinished && std::filesystem::exists(path, ec)) {
        BoostLogger::Warn("Keeping backup \"", path, "\" from an unfinished migration of ", config_.domainName);
        if (observer_) observer_->onBackupWritten(path);
        return;
    }

    BoostLogger::Info("Backing up domain XML to \"", path, "\"");

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw BackupException("Cannot open \"" + path + "\" for writing");
    }
    out << originalXml_;
    out.close();
    if (!out) {
        throw BackupException("Failed writing \"" + path + "\"");
    }
    if (observer_) observer_->onBackupWritten(path);
}

void MigrationSession::undefine() {
    if (!domain_->isPersistent()) {
        BoostLogger::Warn("Domain ", config_.domainName, " is already transient; skipping undefine");
        return;
    }
    domain_->undefineKeepNvram();
}

void MigrationSession::redefine() {
    std::string updated = domain_->xmlDescription();
    domain_->define(updated);
    BoostLogger::Info("Domain ", config_.domainName, " redefined from its updated description");
}
