#ifndef JOB_H
#define JOB_H

#include <QString>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

enum class JobStatus {
    Queued,
    Downloading,
    Extracting,
    Installing,
    Completed,
    Error,
    Cancelled,
    InstallError
};

enum class JobErrorKind {
    None,
    ConfigMissing,
    DependencyUnavailable,
    PathError,
    AuthFailure,
    WrongPassword,
    DataCorruption,
    ProcessTerminated,
    InstallFailure,
    UnexpectedError
};

// Upper bound for any error text stored on a job.
constexpr int MaxErrorLength = 500;

struct Job {
    QString id;             // release name, unique key
    QString displayName;
    QString contentId;      // package identifier
    JobStatus status = JobStatus::Queued;
    int progress = 0;
    int extractProgress = -1;   // -1 when unset
    QString error;
    JobErrorKind errorKind = JobErrorKind::None;
    QString speed;
    QString eta;
    qint64 pid = 0;
    QString localPath;
    qint64 addedAt = 0;     // ms since epoch

    bool hasExtractProgress() const { return extractProgress >= 0; }
    bool isActive() const;

    QJsonObject toJson() const;
    static Job fromJson(const QJsonObject& obj);
};

// Partial update merged by QueueManager::update(). Unset members are left
// alone. For the clearable members an empty string, -1 or 0 clears the field.
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<int> progress;
    std::optional<int> extractProgress;
    std::optional<QString> error;
    std::optional<JobErrorKind> errorKind;
    std::optional<QString> speed;
    std::optional<QString> eta;
    std::optional<qint64> pid;
    std::optional<QString> localPath;
};

QString jobStatusName(JobStatus status);
std::optional<JobStatus> jobStatusFromName(const QString& name);
QString jobErrorKindName(JobErrorKind kind);
JobErrorKind jobErrorKindFromName(const QString& name);

bool isActiveStatus(JobStatus status);
bool isTransitionAllowed(JobStatus from, JobStatus to);

QString truncateError(const QString& message, int maxLength = MaxErrorLength);

Q_DECLARE_METATYPE(Job)

#endif
