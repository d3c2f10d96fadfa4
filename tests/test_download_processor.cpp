#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "downloadprocessor.h"
#include "queuemanager.h"
#include "testsupport.h"

class DownloadProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_downloads = m_dir.filePath("downloads");
        m_argsFile = m_dir.filePath("rclone-args.txt");
        m_callsFile = m_dir.filePath("rclone-calls.txt");
        QDir().mkpath(m_downloads);

        m_queue = std::make_unique<QueueManager>(m_dir.filePath("queue.json"));
        m_processor = std::make_unique<DownloadProcessor>(
            m_queue.get(), &m_deps, &m_source, &m_mirrors, &m_settings, m_downloads);

        QObject::connect(m_processor.get(), &DownloadProcessor::finished,
                         [this](const QString& id, const DownloadResult& result) {
            m_finishedIds << id;
            m_result = result;
        });
        QObject::connect(m_processor.get(), &DownloadProcessor::progressChanged,
                         [this](const QString&, int progress, const QString&, const QString&) {
            m_progress << progress;
        });
    }

    void TearDown() override {
        m_processor.reset();
        m_queue.reset();
    }

    // Fake rclone: records its arguments, then runs body with $dest set
    void fakeRclone(const QString& body) {
        QString script = QString(
            "printf '%s\\n' \"$@\" > '%1'\n"
            "echo \"$2\" >> '%2'\n"
            "dest=\"$3\"\n").arg(m_argsFile, m_callsFile) + body;
        m_deps.transferPath = writeScript(m_dir.path(), "rclone", script);
        ASSERT_FALSE(m_deps.transferPath.isEmpty());
    }

    QStringList recordedArgs() const {
        return readFile(m_argsFile).split('\n', Qt::SkipEmptyParts);
    }

    Job queued(const QString& id) {
        m_queue->add(makeJob(id));
        return *m_queue->find(id);
    }

    bool waitFinished() {
        return waitFor([this]() { return !m_finishedIds.isEmpty(); });
    }

    QTemporaryDir m_dir;
    QString m_downloads;
    QString m_argsFile;
    QString m_callsFile;
    FakeDependencies m_deps;
    FakeRemoteSource m_source;
    FakeMirrors m_mirrors;
    FakeSettings m_settings;
    std::unique_ptr<QueueManager> m_queue;
    std::unique_ptr<DownloadProcessor> m_processor;

    QStringList m_finishedIds;
    DownloadResult m_result;
    QVector<int> m_progress;
};

TEST_F(DownloadProcessorTest, PublicObjectNameIsMd5OfIdWithNewline) {
    EXPECT_EQ(DownloadProcessor::publicObjectName("Game"),
              QString("741dd0c329d4253481aadfa2c9469e4a"));
}

TEST_F(DownloadProcessorTest, PublicDownloadSucceedsAndRequestsExtraction) {
    fakeRclone(QString(
        "echo '%1'\n"
        "echo '%2'\n"
        ": > \"$dest/Game.7z.001\"\n"
        ": > \"$dest/Game.7z.002\"\n"
        "echo '%3'\n"
        "exit 0\n").arg(rcloneStatsLine(0), rcloneStatsLine(50), rcloneStatsLine(100)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_TRUE(m_result.success);
    EXPECT_TRUE(m_result.shouldExtract);
    ASSERT_TRUE(m_result.finalJob.has_value());
    EXPECT_EQ(m_result.finalJob->status, JobStatus::Downloading);
    EXPECT_EQ(m_result.finalJob->progress, 100);
    EXPECT_EQ(m_result.finalJob->localPath, QDir(m_downloads).filePath("Game"));
    EXPECT_TRUE(QFile::exists(QDir(m_downloads).filePath("Game/Game.7z.001")));

    QStringList args = recordedArgs();
    EXPECT_EQ(args.value(0), QString("copy"));
    EXPECT_EQ(args.value(1), QString(":http:/741dd0c329d4253481aadfa2c9469e4a"));
    EXPECT_TRUE(args.contains("--http-url"));
    EXPECT_TRUE(args.contains(m_source.source.baseAddress));
    EXPECT_TRUE(args.contains("/dev/null"));
    EXPECT_TRUE(args.contains("--no-check-certificate"));
    EXPECT_TRUE(args.contains("--stats-one-line"));
    EXPECT_FALSE(args.contains("--bwlimit"));
}

TEST_F(DownloadProcessorTest, ProgressNeverDecreases) {
    fakeRclone(QString("echo '%1'\necho '%2'\necho '%3'\necho '%4'\nexit 0\n")
        .arg(rcloneStatsLine(10), rcloneStatsLine(30), rcloneStatsLine(20), rcloneStatsLine(60)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    ASSERT_FALSE(m_progress.isEmpty());
    for (int i = 1; i < m_progress.size(); ++i) {
        EXPECT_GE(m_progress.at(i), m_progress.at(i - 1));
    }
    EXPECT_FALSE(m_progress.contains(20));
    EXPECT_TRUE(m_progress.contains(60));
}

TEST_F(DownloadProcessorTest, BandwidthLimitsArePassed) {
    m_settings.downloadLimit = 500;
    fakeRclone("exit 0\n");

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    QStringList args = recordedArgs();
    int index = args.indexOf("--bwlimit");
    ASSERT_GE(index, 0);
    EXPECT_EQ(args.value(index + 1), QString("off:500K"));
}

TEST_F(DownloadProcessorTest, AuthenticationFailureEndsInError) {
    fakeRclone(QString("echo '%1'\necho 'ERROR : Game: Auth Error: 401'\nexec sleep 30\n")
        .arg(rcloneStatsLine(40)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_FALSE(m_result.success);
    EXPECT_FALSE(m_result.shouldExtract);
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Error);
    EXPECT_EQ(job.errorKind, JobErrorKind::AuthFailure);
    EXPECT_TRUE(job.error.contains("Authentication"));
    EXPECT_EQ(job.pid, 0);
}

TEST_F(DownloadProcessorTest, NonZeroExitKeepsOutputExcerpt) {
    fakeRclone("echo 'Failed to copy: directory not found'\nexit 3\n");

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Error);
    EXPECT_EQ(job.errorKind, JobErrorKind::UnexpectedError);
    EXPECT_TRUE(job.error.contains("code 3"));
    EXPECT_TRUE(job.error.contains("directory not found"));
    EXPECT_LE(job.error.length(), MaxErrorLength);
}

TEST_F(DownloadProcessorTest, CancelWhileDownloadingEndsCancelled) {
    fakeRclone(QString("echo '%1'\nexec sleep 30\n").arg(rcloneStatsLine(10)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFor([this]() { return m_queue->find("Game")->progress == 10; }));
    EXPECT_NE(m_queue->find("Game")->pid, 0);
    EXPECT_TRUE(m_processor->isActive("Game"));

    m_processor->cancel("Game");
    EXPECT_EQ(m_queue->find("Game")->status, JobStatus::Cancelled);

    ASSERT_TRUE(waitFinished());
    EXPECT_FALSE(m_result.success);
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Cancelled);
    EXPECT_EQ(job.pid, 0);
    EXPECT_EQ(job.progress, 0);
    EXPECT_FALSE(m_processor->isActive("Game"));
}

TEST_F(DownloadProcessorTest, MissingRemoteSourceIsConfigError) {
    m_source.source = RemoteSource();
    fakeRclone("exit 0\n");

    m_processor->start(queued("Game"));

    ASSERT_EQ(m_finishedIds.size(), 1);
    EXPECT_FALSE(m_result.success);
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Error);
    EXPECT_EQ(job.errorKind, JobErrorKind::ConfigMissing);
    EXPECT_FALSE(QFile::exists(m_argsFile));
}

TEST_F(DownloadProcessorTest, TransferToolNotReadyIsDependencyError) {
    m_deps.transferReady = false;

    m_processor->start(queued("Game"));

    ASSERT_EQ(m_finishedIds.size(), 1);
    EXPECT_EQ(m_queue->find("Game")->errorKind, JobErrorKind::DependencyUnavailable);
}

TEST_F(DownloadProcessorTest, MirrorDownloadCompletesWithoutExtraction) {
    QString config = m_dir.filePath("mirror.conf");
    ASSERT_TRUE(writeFile(config, "[mirror1]\ntype = local\n"));
    m_mirrors.mirror = MirrorProfile{"m1", "Mirror One", "mirror1", config};
    fakeRclone(QString("echo '%1'\nexit 0\n").arg(rcloneStatsLine(100)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_TRUE(m_result.success);
    EXPECT_FALSE(m_result.shouldExtract);
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Completed);
    EXPECT_EQ(job.extractProgress, 100);

    QStringList args = recordedArgs();
    EXPECT_EQ(args.value(1), QString("mirror1:/Quest Games/Game"));
    EXPECT_TRUE(args.contains(config));
}

TEST_F(DownloadProcessorTest, MirrorFailureFallsBackToPublic) {
    QString config = m_dir.filePath("mirror.conf");
    ASSERT_TRUE(writeFile(config, "[mirror1]\n"));
    m_mirrors.mirror = MirrorProfile{"m1", "Mirror One", "mirror1", config};
    fakeRclone(QString(
        "case \"$2\" in\n"
        "  mirror1:*) echo '%1'; echo 'ERROR : mirror unreachable'; exit 1 ;;\n"
        "esac\n"
        "echo '%2'\n"
        "exit 0\n").arg(rcloneStatsLine(30), rcloneStatsLine(100)));

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_TRUE(m_result.success);
    EXPECT_TRUE(m_result.shouldExtract);
    QStringList calls = readFile(m_callsFile).split('\n', Qt::SkipEmptyParts);
    ASSERT_EQ(calls.size(), 2);
    EXPECT_TRUE(calls.at(0).startsWith("mirror1:"));
    EXPECT_TRUE(calls.at(1).startsWith(":http:/"));
    EXPECT_TRUE(m_queue->find("Game")->error.isEmpty());
}

TEST_F(DownloadProcessorTest, MirrorFailureSurfacesWhenFallbackDisabled) {
    m_settings.mirrorFallback = false;
    QString config = m_dir.filePath("mirror.conf");
    ASSERT_TRUE(writeFile(config, "[mirror1]\n"));
    m_mirrors.mirror = MirrorProfile{"m1", "Mirror One", "mirror1", config};
    fakeRclone("echo 'ERROR : mirror unreachable'\nexit 1\n");

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_FALSE(m_result.success);
    Job job = *m_queue->find("Game");
    EXPECT_EQ(job.status, JobStatus::Error);
    EXPECT_TRUE(job.error.contains("Mirror transfer failed"));
    EXPECT_EQ(readFile(m_callsFile).split('\n', Qt::SkipEmptyParts).size(), 1);
}

TEST_F(DownloadProcessorTest, MirrorWithoutConfigFileUsesPublicSource) {
    m_mirrors.mirror = MirrorProfile{"m1", "Mirror One", "mirror1", m_dir.filePath("missing.conf")};
    fakeRclone("exit 0\n");

    m_processor->start(queued("Game"));
    ASSERT_TRUE(waitFinished());

    EXPECT_TRUE(recordedArgs().value(1).startsWith(":http:/"));
}
