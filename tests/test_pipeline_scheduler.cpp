#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <stdexcept>
#include "downloadprocessor.h"
#include "extractionprocessor.h"
#include "installationprocessor.h"
#include "pipelinescheduler.h"
#include "queuecontrol.h"
#include "queuemanager.h"
#include "testsupport.h"

namespace {
// Resolver whose transfer path lookup blows up mid-start
class ThrowingDependencies : public FakeDependencies {
public:
    QString transferBinaryPath() const override {
        throw std::runtime_error("resolver exploded");
    }
};
}

class PipelineSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_downloads = m_dir.filePath("downloads");
        m_transferCalls = m_dir.filePath("rclone-calls.txt");
        m_archiveCalls = m_dir.filePath("7z-calls.txt");

        // Release name is the last path component of the destination
        QString rclone = QString(
            "dest=\"$3\"\n"
            "name=$(basename \"$dest\")\n"
            "echo \"$name\" >> '%1'\n"
            "case \"$name\" in\n"
            "  Locked) echo '%2'; echo 'Failed to copy: Auth Error: wrong credentials'; exec sleep 30 ;;\n"
            "  Slow) echo '%3'; exec sleep 30 ;;\n"
            "esac\n"
            "echo '%4'\n"
            "echo '%5'\n"
            "printf 'part1' > \"$dest/$name.7z.001\"\n"
            "printf 'part2' > \"$dest/$name.7z.002\"\n"
            "exit 0\n").arg(m_transferCalls, rcloneStatsLine(40), rcloneStatsLine(5),
                            rcloneStatsLine(50), rcloneStatsLine(100));
        m_deps.transferPath = writeScript(m_dir.path(), "rclone", rclone);

        QString sevenZip = QString(
            "archive=\"$2\"\n"
            "for a in \"$@\"; do\n"
            "  case \"$a\" in\n"
            "    -p*) pw=\"${a#-p}\" ;;\n"
            "    -o*) out=\"${a#-o}\" ;;\n"
            "  esac\n"
            "done\n"
            "name=$(basename \"$archive\" .7z.001)\n"
            "echo \"$name\" >> '%1'\n"
            "if [ \"$pw\" != \"pass\" ] || [ \"$name\" = \"Broken\" ]; then\n"
            "  echo \"ERROR: Wrong password : $name.7z.001\"\n"
            "  exec sleep 30\n"
            "fi\n"
            "echo ' 50% 1 - content.bin'\n"
            "mkdir -p \"$out/$name\"\n"
            "echo data > \"$out/$name/content.bin\"\n"
            "echo '100%'\n"
            "exit 0\n").arg(m_archiveCalls);
        m_deps.archivePath = writeScript(m_dir.path(), "7z", sevenZip);
        ASSERT_FALSE(m_deps.transferPath.isEmpty());
        ASSERT_FALSE(m_deps.archivePath.isEmpty());
    }

    void TearDown() override {
        m_scheduler.reset();
        m_installation.reset();
        m_extraction.reset();
        m_download.reset();
        m_queue.reset();
    }

    void build(DependencyResolver *deps = nullptr) {
        DependencyResolver *resolver = deps ? deps : &m_deps;
        m_queue = std::make_unique<QueueManager>(m_dir.filePath("queue.json"));
        m_download = std::make_unique<DownloadProcessor>(
            m_queue.get(), resolver, &m_source, &m_mirrors, &m_settings, m_downloads);
        m_extraction = std::make_unique<ExtractionProcessor>(m_queue.get(), resolver, &m_source);
        m_extraction->setGracePeriod(500);
        m_installation = std::make_unique<InstallationProcessor>(m_queue.get(), &m_device);
        m_scheduler = std::make_unique<PipelineScheduler>(
            m_queue.get(), m_download.get(), m_extraction.get(), m_installation.get(), resolver);
        m_scheduler->setNotifyDelay(10);

        QObject::connect(m_scheduler.get(), &PipelineScheduler::idle, [this]() { m_idle++; });
        QObject::connect(m_scheduler.get(), &PipelineScheduler::queueChanged,
                         [this](const QVector<Job>& jobs) {
            m_notifications++;
            m_lastSnapshot = jobs;
        });
    }

    JobStatus statusOf(const QString& id) const {
        std::optional<Job> job = m_queue->find(id);
        return job ? job->status : JobStatus::Queued;
    }

    bool waitForStatus(const QString& id, JobStatus status) {
        return waitFor([&]() {
            std::optional<Job> job = m_queue->find(id);
            return job && job->status == status && !m_scheduler->isProcessing();
        });
    }

    QStringList lines(const QString& path) const {
        return readFile(path).split('\n', Qt::SkipEmptyParts);
    }

    void writeQueueFile(const QVector<Job>& jobs) {
        QJsonArray entries;
        for (const Job& job : jobs) entries.append(job.toJson());
        ASSERT_TRUE(writeFile(m_dir.filePath("queue.json"), QJsonDocument(entries).toJson()));
    }

    QTemporaryDir m_dir;
    QString m_downloads;
    QString m_transferCalls;
    QString m_archiveCalls;
    FakeDependencies m_deps;
    ThrowingDependencies m_throwing;
    FakeRemoteSource m_source;
    FakeMirrors m_mirrors;
    FakeSettings m_settings;
    FakeDevice m_device;
    std::unique_ptr<QueueManager> m_queue;
    std::unique_ptr<DownloadProcessor> m_download;
    std::unique_ptr<ExtractionProcessor> m_extraction;
    std::unique_ptr<InstallationProcessor> m_installation;
    std::unique_ptr<PipelineScheduler> m_scheduler;

    int m_idle = 0;
    int m_notifications = 0;
    QVector<Job> m_lastSnapshot;
};

TEST_F(PipelineSchedulerTest, DownloadsAndExtractsQueuedJob) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Game", "Game", "com.example.game"}));

    ASSERT_TRUE(waitForStatus("Game", JobStatus::Completed));
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.progress, 100);
    EXPECT_EQ(job.extractProgress, 100);
    EXPECT_EQ(job.pid, 0);
    EXPECT_TRUE(job.error.isEmpty());

    QDir content(job.localPath);
    EXPECT_EQ(job.localPath, QDir(m_downloads).filePath("Game"));
    EXPECT_FALSE(content.exists("Game.7z.001"));
    EXPECT_FALSE(content.exists("Game.7z.002"));
    EXPECT_TRUE(content.exists("content.bin"));
    EXPECT_EQ(lines(m_archiveCalls), QStringList{"Game"});

    ASSERT_TRUE(waitFor([this]() { return m_idle > 0; }));
    ASSERT_TRUE(waitFor([this]() {
        return !m_lastSnapshot.isEmpty() && m_lastSnapshot.first().status == JobStatus::Completed;
    }));
}

TEST_F(PipelineSchedulerTest, AuthFailureStopsBeforeExtraction) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Locked", "Locked", "com.example.locked"}));

    ASSERT_TRUE(waitForStatus("Locked", JobStatus::Error));
    Job job = *m_queue->find("Locked");
    EXPECT_TRUE(job.error.contains("Authentication"));
    EXPECT_EQ(job.errorKind, JobErrorKind::AuthFailure);
    EXPECT_EQ(job.pid, 0);
    EXPECT_FALSE(QFileInfo::exists(m_archiveCalls));
}

TEST_F(PipelineSchedulerTest, WrongArchivePasswordKeepsParts) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Broken", "Broken", "com.example.broken"}));

    ASSERT_TRUE(waitForStatus("Broken", JobStatus::Error));
    Job job = *m_queue->find("Broken");
    EXPECT_EQ(job.error, QString("Wrong password"));
    EXPECT_EQ(job.errorKind, JobErrorKind::WrongPassword);
    EXPECT_TRUE(QFileInfo::exists(QDir(job.localPath).filePath("Broken.7z.001")));
    EXPECT_TRUE(QFileInfo::exists(QDir(job.localPath).filePath("Broken.7z.002")));
}

TEST_F(PipelineSchedulerTest, RunsOneJobAtATimeInInsertionOrder) {
    build();
    int maxActive = 0;
    auto countActive = [&]() {
        int active = 0;
        for (const Job& job : m_queue->jobs()) {
            if (job.isActive()) active++;
        }
        maxActive = qMax(maxActive, active);
    };
    QObject::connect(m_download.get(), &DownloadProcessor::jobUpdated, countActive);
    QObject::connect(m_extraction.get(), &ExtractionProcessor::jobUpdated, countActive);

    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"First", "First", "com.example.first"}));
    ASSERT_TRUE(m_scheduler->add({"Second", "Second", "com.example.second"}));

    ASSERT_TRUE(waitFor([this]() {
        return statusOf("First") == JobStatus::Completed
            && statusOf("Second") == JobStatus::Completed
            && !m_scheduler->isProcessing();
    }));
    EXPECT_EQ(maxActive, 1);
    EXPECT_EQ(lines(m_transferCalls), (QStringList{"First", "Second"}));
    EXPECT_EQ(lines(m_archiveCalls), (QStringList{"First", "Second"}));
}

TEST_F(PipelineSchedulerTest, ContinuesAfterFailedJob) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Locked", "Locked", "com.example.locked"}));
    ASSERT_TRUE(m_scheduler->add({"Game", "Game", "com.example.game"}));

    ASSERT_TRUE(waitForStatus("Game", JobStatus::Completed));
    EXPECT_EQ(statusOf("Locked"), JobStatus::Error);
    ASSERT_TRUE(waitFor([this]() { return m_idle > 1; }));
}

TEST_F(PipelineSchedulerTest, CancelDuringDownload) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Slow", "Slow", "com.example.slow"}));
    ASSERT_TRUE(waitFor([this]() {
        std::optional<Job> job = m_queue->find("Slow");
        return job && job->status == JobStatus::Downloading && job->pid > 0 && job->progress == 5;
    }));
    EXPECT_EQ(m_scheduler->currentJobId(), QString("Slow"));

    EXPECT_TRUE(m_scheduler->cancel("Slow"));
    Job job = *m_queue->find("Slow");
    EXPECT_EQ(job.status, JobStatus::Cancelled);
    EXPECT_EQ(job.pid, 0);
    EXPECT_EQ(job.progress, 0);

    ASSERT_TRUE(waitFor([this]() { return !m_scheduler->isProcessing(); }));
    EXPECT_EQ(statusOf("Slow"), JobStatus::Cancelled);
    EXPECT_FALSE(m_download->isActive("Slow"));
    EXPECT_FALSE(QFileInfo::exists(m_archiveCalls));
}

TEST_F(PipelineSchedulerTest, CancelRequestFromAnotherInvocationStopsDownload) {
    build();
    m_scheduler->initialize();
    QueueControl control(m_dir.filePath("requests"), m_scheduler.get());
    QStringList handled;
    QObject::connect(&control, &QueueControl::requestHandled,
                     [&](const QString& action, const QString& id, bool success) {
        handled << QString("%1 %2 %3").arg(action, id, success ? "ok" : "refused");
    });
    ASSERT_TRUE(control.listen());

    ASSERT_TRUE(m_scheduler->add({"Slow", "Slow", "com.example.slow"}));
    ASSERT_TRUE(waitFor([this]() {
        std::optional<Job> job = m_queue->find("Slow");
        return job && job->status == JobStatus::Downloading && job->pid > 0;
    }));

    QString error;
    ASSERT_TRUE(QueueControl::submit(control.requestDir(), {"cancel", {"Slow"}}, &error)) << error.toStdString();

    ASSERT_TRUE(waitFor([this]() {
        return statusOf("Slow") == JobStatus::Cancelled && !m_scheduler->isProcessing();
    }));
    EXPECT_FALSE(m_download->isActive("Slow"));
    EXPECT_EQ(handled, QStringList{"cancel Slow ok"});
    EXPECT_TRUE(QDir(control.requestDir()).entryList({"*.json"}, QDir::Files).isEmpty());
}

TEST_F(PipelineSchedulerTest, PendingRequestsAppliedInSubmissionOrder) {
    build();
    m_scheduler->initialize(false);
    QString requests = m_dir.filePath("requests");

    ASSERT_TRUE(QueueControl::submit(requests, {"add", {"Game", "Game", "com.example.game"}}));
    ASSERT_TRUE(QueueControl::submit(requests, {"cancel", {"Game"}}));
    ASSERT_TRUE(QueueControl::submit(requests, {"add", {"Short"}}));
    ASSERT_TRUE(writeFile(QDir(requests).filePath("zz-garbage.json"), "not json"));
    EXPECT_FALSE(QueueControl::submit(requests, {"install", {"Game"}}));

    QueueControl control(requests, m_scheduler.get());
    EXPECT_EQ(control.processPending(), 3);

    EXPECT_EQ(statusOf("Game"), JobStatus::Cancelled);
    EXPECT_FALSE(m_queue->find("Short").has_value());
    EXPECT_TRUE(QDir(requests).entryList(QDir::Files).isEmpty());
    EXPECT_EQ(control.processPending(), 0);
}

TEST_F(PipelineSchedulerTest, CancelRefusedForFinishedJob) {
    build();
    m_scheduler->initialize(false);
    m_queue->add(makeJob("Done", JobStatus::Completed));
    EXPECT_FALSE(m_scheduler->cancel("Done"));
    EXPECT_FALSE(m_scheduler->cancel("Missing"));
    EXPECT_EQ(statusOf("Done"), JobStatus::Completed);
}

TEST_F(PipelineSchedulerTest, CancelQueuedJobWithoutProcess) {
    build();
    m_scheduler->initialize(false);
    ASSERT_TRUE(m_scheduler->add({"Waiting", "Waiting", "com.example.waiting"}));
    EXPECT_TRUE(m_scheduler->cancel("Waiting"));
    EXPECT_EQ(statusOf("Waiting"), JobStatus::Cancelled);
}

TEST_F(PipelineSchedulerTest, RecoversInterruptedJobsOnRestart) {
    QString partial = QDir(m_downloads).filePath("Partial");
    QDir().mkpath(partial);

    Job downloading = makeJob("Partial", JobStatus::Downloading, partial);
    downloading.progress = 40;
    downloading.pid = 4242;
    downloading.speed = "1 MiB/s";
    Job extracting = makeJob("Unpacking", JobStatus::Extracting);
    extracting.progress = 100;
    extracting.extractProgress = 30;
    Job installing = makeJob("Pushing", JobStatus::Installing);
    installing.progress = 20;
    Job done = makeJob("Done", JobStatus::Completed);
    done.progress = 100;
    Job orphan = makeJob("Orphan", JobStatus::Completed, QDir(m_downloads).filePath("Orphan"));
    writeQueueFile({downloading, extracting, installing, done, orphan});

    build();
    m_scheduler->initialize(false);

    ASSERT_EQ(m_queue->jobs().size(), 4);
    Job partialJob = *m_queue->find("Partial");
    EXPECT_EQ(partialJob.status, JobStatus::Queued);
    EXPECT_EQ(partialJob.progress, 0);
    EXPECT_EQ(partialJob.pid, 0);
    EXPECT_TRUE(partialJob.speed.isEmpty());

    Job unpacking = *m_queue->find("Unpacking");
    EXPECT_EQ(unpacking.status, JobStatus::Queued);
    EXPECT_FALSE(unpacking.hasExtractProgress());

    Job pushing = *m_queue->find("Pushing");
    EXPECT_EQ(pushing.status, JobStatus::Completed);
    EXPECT_EQ(pushing.progress, 100);

    EXPECT_EQ(statusOf("Done"), JobStatus::Completed);
    EXPECT_FALSE(m_queue->find("Orphan").has_value());
    EXPECT_EQ(m_notifications, 1);
    EXPECT_FALSE(m_scheduler->isProcessing());
}

TEST_F(PipelineSchedulerTest, BurstOfChangesEmitsOneSnapshot) {
    build();
    m_scheduler->setNotifyDelay(200);
    m_scheduler->initialize(false);
    m_notifications = 0;
    m_lastSnapshot.clear();

    ASSERT_TRUE(m_scheduler->add({"A", "A", "com.example.a"}));
    ASSERT_TRUE(m_scheduler->add({"B", "B", "com.example.b"}));
    ASSERT_TRUE(m_scheduler->add({"C", "C", "com.example.c"}));
    ASSERT_TRUE(m_scheduler->cancel("B"));
    ASSERT_TRUE(m_scheduler->retry("B"));
    ASSERT_TRUE(m_scheduler->cancel("C"));
    EXPECT_EQ(m_notifications, 0);

    ASSERT_TRUE(waitFor([this]() { return m_notifications > 0; }));
    waitFor([]() { return false; }, 500);
    EXPECT_EQ(m_notifications, 1);

    const QVector<Job> current = m_queue->jobs();
    ASSERT_EQ(m_lastSnapshot.size(), current.size());
    for (int i = 0; i < current.size(); ++i) {
        EXPECT_EQ(m_lastSnapshot.at(i).id, current.at(i).id);
        EXPECT_EQ(m_lastSnapshot.at(i).status, current.at(i).status);
    }
    EXPECT_EQ(m_lastSnapshot.at(1).status, JobStatus::Queued);
    EXPECT_EQ(m_lastSnapshot.at(2).status, JobStatus::Cancelled);

    // A change after the window closes starts a new one
    ASSERT_TRUE(m_scheduler->remove("A"));
    ASSERT_TRUE(waitFor([this]() { return m_notifications == 2; }));
    EXPECT_EQ(m_lastSnapshot.size(), 2);
}

TEST_F(PipelineSchedulerTest, AddRules) {
    build();
    EXPECT_FALSE(m_scheduler->add({"Early", "Early", "com.example.early"}));

    m_scheduler->initialize(false);
    EXPECT_FALSE(m_scheduler->add({"  ", "Blank", "com.example.blank"}));

    EXPECT_TRUE(m_scheduler->add({"Game", "Game", "com.example.game"}));
    EXPECT_FALSE(m_scheduler->add({"Game", "Game again", "com.example.game"}));
    EXPECT_EQ(m_queue->jobs().size(), 1);

    JobUpdate failed;
    failed.status = JobStatus::Error;
    failed.error = "boom";
    m_queue->update("Game", failed);
    EXPECT_TRUE(m_scheduler->add({"Game", "Game again", "com.example.game"}));
    Job readded = *m_queue->find("Game");
    EXPECT_EQ(readded.status, JobStatus::Queued);
    EXPECT_EQ(readded.displayName, QString("Game again"));
    EXPECT_TRUE(readded.error.isEmpty());

    m_queue->add(makeJob("Done", JobStatus::Completed));
    EXPECT_FALSE(m_scheduler->add({"Done", "Done", "com.example.done"}));
}

TEST_F(PipelineSchedulerTest, RetryOnlyFromCancelledOrError) {
    build();
    m_scheduler->initialize(false);
    m_queue->add(makeJob("Done", JobStatus::Completed));
    ASSERT_TRUE(m_scheduler->add({"Waiting", "Waiting", "com.example.waiting"}));
    EXPECT_FALSE(m_scheduler->retry("Done"));
    EXPECT_FALSE(m_scheduler->retry("Waiting"));
    EXPECT_FALSE(m_scheduler->retry("Missing"));

    JobUpdate failed;
    failed.status = JobStatus::Error;
    failed.progress = 40;
    failed.error = "Authentication failed";
    failed.errorKind = JobErrorKind::AuthFailure;
    failed.speed = "1 MiB/s";
    failed.eta = "10s";
    m_queue->update("Waiting", failed);

    EXPECT_TRUE(m_scheduler->retry("Waiting"));
    Job job = *m_queue->find("Waiting");
    EXPECT_EQ(job.status, JobStatus::Queued);
    EXPECT_EQ(job.progress, 0);
    EXPECT_FALSE(job.hasExtractProgress());
    EXPECT_TRUE(job.error.isEmpty());
    EXPECT_EQ(job.errorKind, JobErrorKind::None);
    EXPECT_TRUE(job.speed.isEmpty());
    EXPECT_TRUE(job.eta.isEmpty());
}

TEST_F(PipelineSchedulerTest, RetriedJobRunsAgain) {
    build();
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Slow", "Slow", "com.example.slow"}));
    ASSERT_TRUE(waitFor([this]() {
        std::optional<Job> job = m_queue->find("Slow");
        return job && job->status == JobStatus::Downloading && job->pid > 0;
    }));
    ASSERT_TRUE(m_scheduler->cancel("Slow"));
    ASSERT_TRUE(m_scheduler->retry("Slow"));

    ASSERT_TRUE(waitFor([this]() { return lines(m_transferCalls).size() == 2; }));
    EXPECT_EQ(statusOf("Slow"), JobStatus::Downloading);
    EXPECT_TRUE(m_scheduler->cancel("Slow"));
    ASSERT_TRUE(waitFor([this]() { return !m_scheduler->isProcessing(); }));
}

TEST_F(PipelineSchedulerTest, RemoveCompletedJobWithMissingDirectory) {
    build();
    m_scheduler->initialize(false);
    QString path = QDir(m_downloads).filePath("Gone");
    QDir().mkpath(path);
    m_queue->add(makeJob("Gone", JobStatus::Completed, path));
    ASSERT_TRUE(QDir(path).removeRecursively());

    EXPECT_TRUE(m_scheduler->remove("Gone"));
    EXPECT_FALSE(m_queue->find("Gone").has_value());
    EXPECT_FALSE(m_scheduler->remove("Gone"));
}

TEST_F(PipelineSchedulerTest, RemoveRefusedWhileInstalling) {
    build();
    m_scheduler->initialize(false);
    m_queue->add(makeJob("Busy", JobStatus::Installing));
    EXPECT_FALSE(m_scheduler->remove("Busy"));
    EXPECT_FALSE(m_scheduler->deleteFiles("Busy"));
    EXPECT_TRUE(m_queue->find("Busy").has_value());
}

TEST_F(PipelineSchedulerTest, DeleteFilesRemovesDirectoryAndEntry) {
    build();
    m_scheduler->initialize(false);
    QString path = QDir(m_downloads).filePath("Game");
    ASSERT_TRUE(writeFile(path + "/sub/content.bin", "data"));
    m_queue->add(makeJob("Game", JobStatus::Completed, path));

    EXPECT_TRUE(m_scheduler->deleteFiles("Game"));
    EXPECT_FALSE(QFileInfo::exists(path));
    EXPECT_FALSE(m_queue->find("Game").has_value());

    // Missing files still clear the entry, falling back to the downloads directory
    m_queue->add(makeJob("Never", JobStatus::Cancelled));
    EXPECT_TRUE(m_scheduler->deleteFiles("Never"));
    EXPECT_FALSE(m_queue->find("Never").has_value());
}

TEST_F(PipelineSchedulerTest, InstallWaitsForFreeSlot) {
    build();
    m_scheduler->initialize(false);
    QString path = QDir(m_downloads).filePath("Done");
    ASSERT_TRUE(writeFile(path + "/done.apk", "apk"));
    Job done = makeJob("Done", JobStatus::Completed, path);
    done.progress = 100;
    m_queue->add(done);
    m_queue->add(makeJob("Busy", JobStatus::Downloading));

    EXPECT_FALSE(m_scheduler->install("Done", "SERIAL1"));
    EXPECT_TRUE(m_device.calls.isEmpty());
    EXPECT_EQ(statusOf("Done"), JobStatus::Completed);

    JobUpdate cancelled;
    cancelled.status = JobStatus::Cancelled;
    m_queue->update("Busy", cancelled);

    int installUpdates = 0;
    QObject::connect(m_scheduler.get(), &PipelineScheduler::installProgress,
                     [&](const QString&, int) { installUpdates++; });
    EXPECT_TRUE(m_scheduler->install("Done", "SERIAL1"));
    EXPECT_EQ(m_device.installedFiles, QStringList{path + "/done.apk"});
    EXPECT_EQ(statusOf("Done"), JobStatus::Completed);
    EXPECT_GT(installUpdates, 0);
    EXPECT_FALSE(m_scheduler->install("Missing", "SERIAL1"));
}

TEST_F(PipelineSchedulerTest, UnexpectedExceptionBecomesJobError) {
    m_throwing.transferPath = m_deps.transferPath;
    m_throwing.archivePath = m_deps.archivePath;
    build(&m_throwing);
    m_scheduler->initialize();
    ASSERT_TRUE(m_scheduler->add({"Game", "Game", "com.example.game"}));

    ASSERT_TRUE(waitForStatus("Game", JobStatus::Error));
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.errorKind, JobErrorKind::UnexpectedError);
    EXPECT_TRUE(job.error.contains("resolver exploded"));
    ASSERT_TRUE(waitFor([this]() { return m_idle > 1; }));
}

TEST_F(PipelineSchedulerTest, IdleWhenTransferToolMissing) {
    m_deps.transferReady = false;
    build();
    m_scheduler->initialize();
    EXPECT_EQ(m_idle, 1);
    ASSERT_TRUE(m_scheduler->add({"Game", "Game", "com.example.game"}));
    ASSERT_TRUE(waitFor([this]() { return m_idle == 2; }));
    EXPECT_EQ(statusOf("Game"), JobStatus::Queued);
    EXPECT_FALSE(m_scheduler->isProcessing());
}
