#include <gtest/gtest.h>
#include "transfer_pipeline.hpp"
#include "test_doubles.hpp"

#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const std::string kReference = "https://source.example.net:2083/backups/backup-10.18.2026_12-00-00_user1.tar.gz?session=abc";
const std::string kArtifactName = "backup-10.18.2026_12-00-00_user1.tar.gz";

} // namespace

class TransferPipelineTest : public ::testing::Test {
protected:
    TransferPipelineTest() : pipeline(config, jobs, http, connector, &sink) {}

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        stagingDir = fs::path(::testing::TempDir()) / "cpmigrate_pipeline" / info->name();
        fs::remove_all(stagingDir);
        config.localRoot = stagingDir.string() + "/";
        config.remoteRoot = "/home/";
        config.pollInterval = std::chrono::milliseconds(1);
        config.pollCeiling = std::chrono::milliseconds(60);
        config.restoreReadInterval = std::chrono::milliseconds(1);
        jobs.handles = {FakeBackupJobApi::ready(kReference)};
        connector.state->restoreOutput = {{"Restoring account user1\n", false}, {"Account restore complete\n", false}};
    }

    void TearDown() override { fs::remove_all(stagingDir); }

    fs::path localArtifact() const { return stagingDir / kArtifactName; }

    MigrationConfig config;
    FakeBackupJobApi jobs;
    FakeHttpClient http;
    FakeConnector connector;
    RecordingSink sink;
    TransferPipeline pipeline;
    CancellationToken token;
    fs::path stagingDir;
};

TEST_F(TransferPipelineTest, CompletesWhenEveryStageSucceeds) {
    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error, ErrorKind::None);
    EXPECT_EQ(result.stage, PipelineStage::Completed);
    EXPECT_EQ(pipeline.stage(), PipelineStage::Completed);
    ASSERT_TRUE(result.exitStatus.has_value());
    EXPECT_EQ(*result.exitStatus, 0);
    EXPECT_EQ(result.transcript, "Restoring account user1\nAccount restore complete\n");
    EXPECT_EQ(jobs.triggers, 1);
    EXPECT_EQ(jobs.polls, 1);
}

TEST_F(TransferPipelineTest, KeepsTheSourceFilename) {
    pipeline.execute(sampleRequest(), token);

    ASSERT_EQ(http.downloads.size(), 1u);
    EXPECT_EQ(http.downloads[0].first, kReference);
    EXPECT_EQ(fs::path(http.downloads[0].second).filename(), kArtifactName);
    ASSERT_EQ(connector.state->pushes.size(), 1u);
    EXPECT_EQ(connector.state->pushes[0].first, localArtifact().string());
    EXPECT_EQ(connector.state->pushes[0].second, "/home/" + kArtifactName);
    EXPECT_TRUE(connector.state->localExistedAtPush);
}

TEST_F(TransferPipelineTest, RunsRestoreAgainstUploadedPath) {
    pipeline.execute(sampleRequest(), token);

    ASSERT_FALSE(connector.state->commands.empty());
    EXPECT_EQ(connector.state->commands.back(), "/scripts/restorepkg '/home/" + kArtifactName + "'");
    EXPECT_EQ(connector.state->lastHost, "dest.example.net");
    EXPECT_EQ(connector.state->lastCredentials.user, "root");
}

TEST_F(TransferPipelineTest, RemovesLocalArtifactAfterSuccess) {
    pipeline.execute(sampleRequest(), token);
    EXPECT_FALSE(fs::exists(localArtifact()));
    EXPECT_EQ(connector.state->connects, 1);
    EXPECT_EQ(connector.state->closes, 1);
}

TEST_F(TransferPipelineTest, NonZeroRestoreExitFailsWithTranscript) {
    connector.state->restoreOutput = {{"Extracting...\n", false}, {"Error: quota exceeded\n", false}};
    connector.state->restoreExit = 3;

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::RestoreError);
    EXPECT_EQ(result.stage, PipelineStage::Restoring);
    EXPECT_EQ(pipeline.stage(), PipelineStage::Failed);
    ASSERT_TRUE(result.exitStatus.has_value());
    EXPECT_EQ(*result.exitStatus, 3);
    EXPECT_NE(result.transcript.find("Error: quota exceeded"), std::string::npos);
    EXPECT_NE(result.transcript.find("status 3"), std::string::npos);
    EXPECT_FALSE(fs::exists(localArtifact()));
}

TEST_F(TransferPipelineTest, TimesOutAfterCeilingOverInterval) {
    jobs.handles = {BackupJobHandle{}};

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::BackupTimeout);
    EXPECT_EQ(result.stage, PipelineStage::Polling);
    EXPECT_EQ(jobs.polls, 60);
    EXPECT_TRUE(http.downloads.empty());
    EXPECT_EQ(connector.state->connects, 0);
}

TEST_F(TransferPipelineTest, FailingPollsDoNotExtendTheCeiling) {
    jobs.throwOnPoll = true;

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::BackupTimeout);
    EXPECT_EQ(jobs.polls, 60);
}

TEST_F(TransferPipelineTest, SlowStatusCallsCountAgainstCeiling) {
    config.pollInterval = std::chrono::milliseconds(10);
    config.pollCeiling = std::chrono::milliseconds(100);
    jobs.handles = {BackupJobHandle{}};
    jobs.pollDelay = std::chrono::milliseconds(30);

    auto started = std::chrono::steady_clock::now();
    auto result = pipeline.execute(sampleRequest(), token);
    auto took = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.error, ErrorKind::BackupTimeout);
    EXPECT_LE(jobs.polls, 3);
    EXPECT_LT(took, std::chrono::milliseconds(300));
    ASSERT_FALSE(jobs.pollTimeouts.empty());
    EXPECT_EQ(jobs.pollTimeouts.front(), std::chrono::milliseconds(100));
    for (std::size_t i = 1; i < jobs.pollTimeouts.size(); ++i) {
        EXPECT_LT(jobs.pollTimeouts[i], jobs.pollTimeouts[i - 1]);
    }
}

TEST_F(TransferPipelineTest, BecomesReadyAfterSeveralPolls) {
    jobs.handles = {BackupJobHandle{}, BackupJobHandle{}, FakeBackupJobApi::ready(kReference)};

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(jobs.polls, 3);
}

TEST_F(TransferPipelineTest, ReportedBackupFailureStopsPolling) {
    BackupJobHandle failed;
    failed.status = BackupJobStatus::Failed;
    jobs.handles = {failed};

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::BackupFailed);
    EXPECT_EQ(jobs.polls, 1);
}

TEST_F(TransferPipelineTest, RejectedTriggerIsNotRetried) {
    jobs.triggerError = "HTTP 403";

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::TriggerFailed);
    EXPECT_EQ(result.stage, PipelineStage::Triggering);
    EXPECT_EQ(jobs.triggers, 1);
    EXPECT_EQ(jobs.polls, 0);
}

TEST_F(TransferPipelineTest, ExceptionBecomesStageError) {
    jobs.throwOnTrigger = true;

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::TriggerFailed);
    EXPECT_NE(result.transcript.find("job API unavailable"), std::string::npos);
}

TEST_F(TransferPipelineTest, NonStandardExceptionBecomesStageError) {
    jobs.throwNonStandardOnTrigger = true;

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::TriggerFailed);
    EXPECT_NE(result.detail.find("unknown error"), std::string::npos);
}

TEST_F(TransferPipelineTest, DownloadErrorRemovesPartialFile) {
    http.downloadError = "HTTP 404";

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::DownloadError);
    EXPECT_EQ(result.stage, PipelineStage::Downloading);
    EXPECT_FALSE(fs::exists(localArtifact()));
    EXPECT_EQ(connector.state->connects, 0);
}

TEST_F(TransferPipelineTest, UnusableReferenceIsDownloadError) {
    jobs.handles = {FakeBackupJobApi::ready("https://source.example.net:2083/backups/")};

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::DownloadError);
    EXPECT_TRUE(http.downloads.empty());
}

TEST_F(TransferPipelineTest, DestinationConnectFailure) {
    connector.state->connectError = "Connection refused";

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::ConnectionError);
    EXPECT_EQ(result.stage, PipelineStage::Uploading);
    EXPECT_FALSE(fs::exists(localArtifact()));
}

TEST_F(TransferPipelineTest, UploadErrorIsSurfaced) {
    connector.state->pushError = "disk full";

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::UploadError);
    EXPECT_EQ(result.stage, PipelineStage::Uploading);
    EXPECT_NE(result.detail.find("disk full"), std::string::npos);
    EXPECT_EQ(connector.state->closes, connector.state->connects);
    EXPECT_FALSE(fs::exists(localArtifact()));
}

TEST_F(TransferPipelineTest, LostRestoreStreamKeepsPartialTranscript) {
    connector.state->restoreOutput = {{"Restoring mail...\n", false}};
    connector.state->streamReadError = "connection reset";

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::RestoreError);
    EXPECT_NE(result.transcript.find("Restoring mail..."), std::string::npos);
    EXPECT_NE(result.transcript.find("connection reset"), std::string::npos);
}

TEST_F(TransferPipelineTest, CancelledTokenStopsBeforeTrigger) {
    token.cancel();

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::Cancelled);
    EXPECT_EQ(jobs.triggers, 0);
}

TEST_F(TransferPipelineTest, FinishedRestoreKeepsItsOutcomeAfterLateCancel) {
    connector.state->restoreExit = 3;
    connector.state->onExitStatus = [this] { token.cancel(); };

    auto result = pipeline.execute(sampleRequest(), token);

    EXPECT_EQ(result.error, ErrorKind::RestoreError);
    ASSERT_TRUE(result.exitStatus.has_value());
    EXPECT_EQ(*result.exitStatus, 3);
}

TEST_F(TransferPipelineTest, DeadlineEndsPolling) {
    config.pollCeiling = std::chrono::hours(1);
    config.pollInterval = std::chrono::milliseconds(5);
    jobs.handles = {BackupJobHandle{}};
    CancellationToken deadline(std::chrono::milliseconds(30));

    auto result = pipeline.execute(sampleRequest(), deadline);

    EXPECT_EQ(result.error, ErrorKind::Cancelled);
    EXPECT_EQ(result.stage, PipelineStage::Polling);
}

TEST_F(TransferPipelineTest, PublishesEveryStage) {
    pipeline.execute(sampleRequest(), token);

    for (auto stage : {PipelineStage::Triggering, PipelineStage::Polling, PipelineStage::Downloading,
                       PipelineStage::Uploading, PipelineStage::Restoring, PipelineStage::Completed}) {
        EXPECT_TRUE(sink.sawStage(stage)) << toString(stage);
    }
}

TEST(ArtifactFilenameTest, UsesLastPathSegmentVerbatim) {
    EXPECT_EQ(TransferPipeline::artifactFilename("https://h:2083/a/b/cpmove-user1.tar.gz").value(), "cpmove-user1.tar.gz");
    EXPECT_EQ(TransferPipeline::artifactFilename("https://h/x/backup_1.tar.gz?token=1#frag").value(), "backup_1.tar.gz");
    EXPECT_EQ(TransferPipeline::artifactFilename("/relative/file.tar.gz").value(), "file.tar.gz");
}

TEST(ArtifactFilenameTest, RejectsMissingOrTraversingNames) {
    EXPECT_FALSE(TransferPipeline::artifactFilename("https://h").has_value());
    EXPECT_FALSE(TransferPipeline::artifactFilename("https://h/dir/").has_value());
    EXPECT_FALSE(TransferPipeline::artifactFilename("https://h/dir/..").has_value());
    EXPECT_FALSE(TransferPipeline::artifactFilename("").has_value());
}
