#include "Migration/MigrationSession.hpp"
#include "Migration/VolumeInventory.hpp"
#include "Virtualization/builder/DiskDefinitionBuilder.hpp"
#include "support/DomainXml.hpp"
#include "support/FakeHypervisorDomain.hpp"
#include "support/FakePollClock.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Return;

namespace {

class MockPrompt : public IOperatorPrompt {
public:
    MOCK_METHOD(bool, confirm, (const std::string& question), (override));
};

class StateRecorder : public IMigrationObserver {
public:
    void onStateChanged(SessionState, SessionState to) override { states.push_back(to); }
    void onPlanReady(const std::string&, const MigrationDestination&, const MigrationPlan&,
                     const std::vector<PlannedCopy>& planned) override { copies = planned; }
    void onResume(const std::vector<std::string>& devices) override { resumed = devices; }
    void onBackupWritten(const std::string& path) override { backups.push_back(path); }

    std::vector<SessionState> states;
    std::vector<PlannedCopy> copies;
    std::vector<std::string> resumed;
    std::vector<std::string> backups;
};

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

class MigrationSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        backupDir = fs::temp_directory_path() /
                    ("livestor-test-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(backupDir);
        domain = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::web01);
        prompt = std::make_shared<::testing::NiceMock<MockPrompt>>();
        ON_CALL(*prompt, confirm(_)).WillByDefault(Return(true));
    }

    void TearDown() override { fs::remove_all(backupDir); }

    MigrationConfig config(const MigrationDestination& destination) const {
        MigrationConfig cfg{"web01", destination};
        cfg.backupDirectory = backupDir.string();
        return cfg;
    }

    std::unique_ptr<MigrationSession> session(const MigrationDestination& destination) {
        return std::make_unique<MigrationSession>(config(destination), domain, prompt, clock, recorder);
    }

    fs::path backupDir;
    std::shared_ptr<FakeHypervisorDomain> domain;
    std::shared_ptr<::testing::NiceMock<MockPrompt>> prompt;
    std::shared_ptr<FakePollClock> clock = std::make_shared<FakePollClock>();
    std::shared_ptr<StateRecorder> recorder = std::make_shared<StateRecorder>();
    MigrationDestination toPoolB = MigrationDestination::toFilePath("/data/pool-b");
};

} // namespace

TEST_F(MigrationSessionTest, Web01MigratesBothDisksToDirectory) {
    auto run = session(toPoolB);
    EXPECT_EQ(run->run(), SessionState::Done);

    EXPECT_EQ(run->plan().pendingDevices(), (std::set<std::string>{"vda", "vdb"}));
    EXPECT_FALSE(run->resumed());

    EXPECT_EQ(recorder->states, (std::vector<SessionState>{
        SessionState::Plan, SessionState::ConfirmDestructive, SessionState::Backup, SessionState::Undefine,
        SessionState::LaunchAll, SessionState::MonitorAll, SessionState::PivotAll, SessionState::Redefine,
        SessionState::Done}));

    // Persisted definition points at the new directory.
    ASSERT_EQ(domain->definedXml.size(), 1u);
    VolumeMap after = VolumeInventory::parse(domain->definedXml.front());
    EXPECT_EQ(after.at("vda").describe(), "/data/pool-b/web01.qcow2");
    EXPECT_EQ(after.at("vdb").describe(), "/data/pool-b/web01-data.qcow2");
    EXPECT_TRUE(domain->persistentNow());

    // Backup holds the original two-disk description.
    fs::path backup = backupDir / "web01_backup.xml";
    EXPECT_EQ(recorder->backups, (std::vector<std::string>{backup.string()}));
    EXPECT_EQ(readFile(backup), DomainXml::web01);
    EXPECT_EQ(VolumeInventory::parse(readFile(backup)).size(), 2u);
}

TEST_F(MigrationSessionTest, DestructiveStepsRunInOrder) {
    session(toPoolB)->run();

    auto position = [this](const std::string& call) {
        return std::find(domain->calls.begin(), domain->calls.end(), call) - domain->calls.begin();
    };
    EXPECT_LT(position("undefine"), position("blockCopy:vda"));
    EXPECT_LT(position("blockCopy:vdb"), position("pivot:vda"));
    EXPECT_LT(position("pivot:vdb"), position("define"));
    EXPECT_EQ(domain->count("undefine"), 1u);
}

TEST_F(MigrationSessionTest, SecondRunIsNoop) {
    session(toPoolB)->run();
    const std::size_t mutationsAfterFirstRun = domain->mutatingCalls();

    recorder->states.clear();
    auto again = session(toPoolB);
    EXPECT_EQ(again->run(), SessionState::Done);

    EXPECT_TRUE(again->plan().pending.empty());
    EXPECT_EQ(again->plan().alreadyMigrated.size(), 2u);
    EXPECT_EQ(domain->mutatingCalls(), mutationsAfterFirstRun);
    EXPECT_EQ(recorder->states, (std::vector<SessionState>{SessionState::Plan, SessionState::Done}));
}

TEST_F(MigrationSessionTest, NoopDoesNotAskOrBackUp) {
    auto poolDomain = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::withDisks(
        "<disk type='volume'><source pool='fast-ssd' volume='a'/><target dev='vda'/></disk>"));
    domain = poolDomain;
    EXPECT_CALL(*prompt, confirm(_)).Times(0);

    EXPECT_EQ(session(MigrationDestination::toPool("fast-ssd"))->run(), SessionState::Done);
    EXPECT_EQ(poolDomain->mutatingCalls(), 0u);
    EXPECT_FALSE(fs::exists(backupDir / "web01_backup.xml"));
}

TEST_F(MigrationSessionTest, OperatorDeclineAbortsWithoutMutation) {
    EXPECT_CALL(*prompt, confirm(_)).WillOnce(Return(false));

    auto run = session(toPoolB);
    EXPECT_THROW(run->run(), OperatorDeclinedException);

    EXPECT_EQ(run->state(), SessionState::Aborted);
    EXPECT_EQ(run->failedIn(), SessionState::ConfirmDestructive);
    EXPECT_EQ(domain->mutatingCalls(), 0u);
    EXPECT_FALSE(fs::exists(backupDir / "web01_backup.xml"));
}

TEST_F(MigrationSessionTest, AssumeYesSkipsPrompt) {
    EXPECT_CALL(*prompt, confirm(_)).Times(0);
    MigrationConfig cfg = config(toPoolB);
    cfg.assumeYes = true;

    MigrationSession run(cfg, domain, prompt, clock, recorder);
    EXPECT_EQ(run.run(), SessionState::Done);
}

TEST_F(MigrationSessionTest, LaunchFailureIssuesNoPivot) {
    domain->failCopyOn.insert("vdb");

    auto run = session(toPoolB);
    EXPECT_THROW(run->run(), HypervisorOperationException);

    EXPECT_EQ(domain->count("blockCopy:vda"), 1u);
    EXPECT_EQ(domain->count("pivot:vda"), 0u);
    EXPECT_EQ(domain->count("define"), 0u);
    EXPECT_EQ(run->state(), SessionState::Aborted);
    EXPECT_EQ(run->failedIn(), SessionState::LaunchAll);
    // The backup is the recovery artifact and stays behind.
    EXPECT_TRUE(fs::exists(backupDir / "web01_backup.xml"));
}

TEST_F(MigrationSessionTest, RerunAfterInterruptedLaunchResumesWithoutRelaunching) {
    // First run launched both copies and died before pivoting: the domain is
    // transient and both jobs are still in flight.
    auto interrupted = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::web01, false);
    const auto volumes = VolumeInventory::parse(DomainXml::web01);
    for (const auto& [device, volume] : volumes) {
        std::string xml = DiskDefinitionBuilder{}.setDestination(toPoolB).forVolume(volume).build();
        interrupted->leaveRunningJob(device, xml, {BlockJobStatus{70, 100}, BlockJobStatus{100, 100}});
    }
    domain = interrupted;
    EXPECT_CALL(*prompt, confirm(_)).Times(0);

    auto run = session(toPoolB);
    EXPECT_EQ(run->run(), SessionState::Done);

    EXPECT_TRUE(run->resumed());
    EXPECT_EQ(recorder->resumed, (std::vector<std::string>{"vda", "vdb"}));
    EXPECT_EQ(recorder->states, (std::vector<SessionState>{
        SessionState::Plan, SessionState::ResumeMonitor, SessionState::Pivot, SessionState::Redefine,
        SessionState::Done}));
    EXPECT_EQ(interrupted->count("blockCopy:vda"), 0u);
    EXPECT_EQ(interrupted->count("blockCopy:vdb"), 0u);
    EXPECT_EQ(interrupted->count("undefine"), 0u);
    EXPECT_EQ(interrupted->count("pivot:vda"), 1u);
    EXPECT_EQ(interrupted->count("pivot:vdb"), 1u);
    EXPECT_TRUE(interrupted->persistentNow());
    EXPECT_FALSE(fs::exists(backupDir / "web01_backup.xml"));

    VolumeMap after = VolumeInventory::parse(interrupted->definedXml.at(0));
    EXPECT_EQ(after.at("vdb").describe(), "/data/pool-b/web01-data.qcow2");
}

TEST_F(MigrationSessionTest, RealInterruptionIsPickedUpByNextRun) {
    // Status queries start failing after the first wait, standing in for a
    // process killed while monitoring.
    auto fake = domain;
    clock->onSleep = [fake](std::size_t) { fake->failJobInfoOn.insert("vda"); };
    EXPECT_THROW(session(toPoolB)->run(), HypervisorOperationException);
    EXPECT_EQ(domain->count("blockCopy:vda"), 1u);
    EXPECT_EQ(domain->count("pivot:vda"), 0u);
    EXPECT_FALSE(domain->persistentNow());

    clock->onSleep = nullptr;
    domain->failJobInfoOn.clear();
    recorder->states.clear();
    auto next = session(toPoolB);
    EXPECT_EQ(next->run(), SessionState::Done);

    EXPECT_TRUE(next->resumed());
    EXPECT_EQ(domain->count("blockCopy:vda"), 1u);
    EXPECT_EQ(domain->count("blockCopy:vdb"), 1u);
    EXPECT_EQ(domain->count("pivot:vda"), 1u);
    EXPECT_EQ(domain->count("pivot:vdb"), 1u);
    EXPECT_TRUE(domain->persistentNow());
}

TEST_F(MigrationSessionTest, PartialResumeLeavesUnlaunchedDiskForNextRun) {
    // Launch of vdb failed last time, after vda had started.
    auto partial = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::web01, false);
    const auto volumes = VolumeInventory::parse(DomainXml::web01);
    partial->leaveRunningJob("vda", DiskDefinitionBuilder{}.setDestination(toPoolB).forVolume(volumes.at("vda")).build(),
                             {BlockJobStatus{100, 100}});
    domain = partial;

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(partial->count("pivot:vda"), 1u);
    EXPECT_EQ(partial->count("blockCopy:vdb"), 0u);

    // The following run migrates the remaining disk through the normal path.
    recorder->states.clear();
    auto next = session(toPoolB);
    EXPECT_EQ(next->run(), SessionState::Done);
    EXPECT_EQ(next->plan().pendingDevices(), (std::set<std::string>{"vdb"}));
    EXPECT_FALSE(next->resumed());
    EXPECT_EQ(partial->count("blockCopy:vdb"), 1u);
    EXPECT_EQ(partial->count("blockCopy:vda"), 0u);
}

TEST_F(MigrationSessionTest, TransientDomainSkipsUndefine) {
    auto transient = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::web01, false);
    domain = transient;

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(transient->count("undefine"), 0u);
    EXPECT_EQ(transient->count("define"), 1u);
}

TEST_F(MigrationSessionTest, TransientDomainKeepsExistingBackup) {
    // Interrupted between Undefine and LaunchAll; the backup holds the persistent definition.
    const fs::path backup = backupDir / "web01_backup.xml";
    { std::ofstream out(backup); out << "<domain>persistent definition</domain>"; }
    domain = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::web01, false);

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(readFile(backup), "<domain>persistent definition</domain>");
    EXPECT_EQ(recorder->backups, (std::vector<std::string>{backup.string()}));
}

TEST_F(MigrationSessionTest, PartlyMigratedDomainKeepsExistingBackup) {
    const fs::path backup = backupDir / "web01_backup.xml";
    { std::ofstream out(backup); out << "<domain>persistent definition</domain>"; }
    domain = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::withDisks(
        "<disk type='file'><source file='/data/pool-b/web01.qcow2'/><target dev='vda'/></disk>"
        "<disk type='file'><source file='/data/pool-a/web01-data.qcow2'/><target dev='vdb'/></disk>"));

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(domain->count("blockCopy:vdb"), 1u);
    EXPECT_EQ(readFile(backup), "<domain>persistent definition</domain>");
}

TEST_F(MigrationSessionTest, FreshMigrationReplacesStaleBackup) {
    const fs::path backup = backupDir / "web01_backup.xml";
    { std::ofstream out(backup); out << "<domain>stale</domain>"; }

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(readFile(backup), DomainXml::web01);
}

TEST_F(MigrationSessionTest, MigratedTransientDomainIsRedefined) {
    // Interrupted between PivotAll and Redefine.
    auto migrated = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::withDisks(
        "<disk type='file'><source file='/data/pool-b/web01.qcow2'/><target dev='vda'/></disk>"), false);
    domain = migrated;

    EXPECT_EQ(session(toPoolB)->run(), SessionState::Done);
    EXPECT_EQ(recorder->states, (std::vector<SessionState>{
        SessionState::Plan, SessionState::Redefine, SessionState::Done}));
    EXPECT_EQ(migrated->count("define"), 1u);
    EXPECT_EQ(migrated->count("undefine"), 0u);
    EXPECT_TRUE(migrated->persistentNow());
}

TEST_F(MigrationSessionTest, MalformedDescriptionAbortsBeforeMutation) {
    auto broken = std::make_shared<FakeHypervisorDomain>("web01", DomainXml::withDisks(
        "<disk type='block'><source dev='/dev/sdb'/><target dev='vdc'/></disk>"));
    domain = broken;
    EXPECT_CALL(*prompt, confirm(_)).Times(0);

    auto run = session(toPoolB);
    EXPECT_THROW(run->run(), MalformedDescriptorException);
    EXPECT_EQ(run->failedIn(), SessionState::Inspect);
    EXPECT_EQ(broken->mutatingCalls(), 0u);
}

TEST_F(MigrationSessionTest, UnwritableBackupAbortsBeforeUndefine) {
    MigrationConfig cfg = config(toPoolB);
    cfg.backupDirectory = (backupDir / "missing" / "dir").string();

    MigrationSession run(cfg, domain, prompt, clock, recorder);
    EXPECT_THROW(run.run(), BackupException);
    EXPECT_EQ(run.failedIn(), SessionState::Backup);
    EXPECT_EQ(domain->mutatingCalls(), 0u);
}

TEST_F(MigrationSessionTest, PlanShowsDestinationOfEachPendingDisk) {
    session(toPoolB)->run();

    ASSERT_EQ(recorder->copies.size(), 2u);
    EXPECT_EQ(recorder->copies[0].targetDevice, "vda");
    EXPECT_EQ(recorder->copies[0].source, "/data/pool-a/web01.qcow2");
    EXPECT_EQ(recorder->copies[0].destination, "/data/pool-b/web01.qcow2");
    EXPECT_EQ(recorder->copies[1].source, "fast-ssd/web01-data.qcow2");
    EXPECT_EQ(recorder->copies[1].destination, "/data/pool-b/web01-data.qcow2");
    EXPECT_NE(recorder->copies[1].destinationXml.find("web01-data.qcow2"), std::string::npos);
}

TEST_F(MigrationSessionTest, PollsAtConfiguredInterval) {
    MigrationConfig cfg = config(toPoolB);
    cfg.pollInterval = std::chrono::milliseconds(250);

    MigrationSession run(cfg, domain, prompt, clock, recorder);
    run.run();

    // Fake jobs report 50% then 100%: one wait.
    EXPECT_EQ(clock->sleeps, 1u);
    EXPECT_EQ(clock->elapsed, std::chrono::steady_clock::duration(std::chrono::milliseconds(250)));
}

TEST_F(MigrationSessionTest, RunIsSingleUse) {
    auto run = session(toPoolB);
    run->run();
    EXPECT_THROW(run->run(), std::logic_error);
}
