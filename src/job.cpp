#include "job.h"
#include <QVariant>

namespace {

const JobStatus AllStatuses[] = {
    JobStatus::Queued, JobStatus::Downloading, JobStatus::Extracting,
    JobStatus::Installing, JobStatus::Completed, JobStatus::Error,
    JobStatus::Cancelled, JobStatus::InstallError
};

const JobErrorKind AllErrorKinds[] = {
    JobErrorKind::ConfigMissing, JobErrorKind::DependencyUnavailable,
    JobErrorKind::PathError, JobErrorKind::AuthFailure,
    JobErrorKind::WrongPassword, JobErrorKind::DataCorruption,
    JobErrorKind::ProcessTerminated, JobErrorKind::InstallFailure,
    JobErrorKind::UnexpectedError
};

} // namespace

QString jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Queued: return "Queued";
    case JobStatus::Downloading: return "Downloading";
    case JobStatus::Extracting: return "Extracting";
    case JobStatus::Installing: return "Installing";
    case JobStatus::Completed: return "Completed";
    case JobStatus::Error: return "Error";
    case JobStatus::Cancelled: return "Cancelled";
    case JobStatus::InstallError: return "InstallError";
    }
    return QString();
}

std::optional<JobStatus> jobStatusFromName(const QString& name) {
    for (JobStatus status : AllStatuses) {
        if (jobStatusName(status) == name) return status;
    }
    return std::nullopt;
}

QString jobErrorKindName(JobErrorKind kind) {
    switch (kind) {
    case JobErrorKind::None: return QString();
    case JobErrorKind::ConfigMissing: return "ConfigMissing";
    case JobErrorKind::DependencyUnavailable: return "DependencyUnavailable";
    case JobErrorKind::PathError: return "PathError";
    case JobErrorKind::AuthFailure: return "AuthFailure";
    case JobErrorKind::WrongPassword: return "WrongPassword";
    case JobErrorKind::DataCorruption: return "DataCorruption";
    case JobErrorKind::ProcessTerminated: return "ProcessTerminated";
    case JobErrorKind::InstallFailure: return "InstallFailure";
    case JobErrorKind::UnexpectedError: return "UnexpectedError";
    }
    return QString();
}

JobErrorKind jobErrorKindFromName(const QString& name) {
    if (name.isEmpty()) return JobErrorKind::None;
    for (JobErrorKind kind : AllErrorKinds) {
        if (jobErrorKindName(kind) == name) return kind;
    }
    return JobErrorKind::UnexpectedError;
}

bool isActiveStatus(JobStatus status) {
    return status == JobStatus::Downloading
        || status == JobStatus::Extracting
        || status == JobStatus::Installing;
}

bool Job::isActive() const {
    return isActiveStatus(status);
}

bool isTransitionAllowed(JobStatus from, JobStatus to) {
    if (from == to) return true;

    switch (from) {
    case JobStatus::Queued:
        return to == JobStatus::Downloading || to == JobStatus::Error
            || to == JobStatus::Cancelled;
    case JobStatus::Downloading:
        return to == JobStatus::Extracting || to == JobStatus::Completed
            || to == JobStatus::Error || to == JobStatus::Cancelled
            || to == JobStatus::Queued;
    case JobStatus::Extracting:
        return to == JobStatus::Completed || to == JobStatus::Error
            || to == JobStatus::Cancelled || to == JobStatus::Queued;
    case JobStatus::Completed:
        return to == JobStatus::Installing || to == JobStatus::InstallError;
    case JobStatus::Installing:
        return to == JobStatus::Completed || to == JobStatus::InstallError;
    case JobStatus::InstallError:
        return to == JobStatus::Installing;
    case JobStatus::Error:
        return to == JobStatus::Queued || to == JobStatus::Cancelled;
    case JobStatus::Cancelled:
        return to == JobStatus::Queued || to == JobStatus::Error;
    }
    return false;
}

QString truncateError(const QString& message, int maxLength) {
    return message.length() > maxLength ? message.left(maxLength) : message;
}

QJsonObject Job::toJson() const {
    QJsonObject obj;
    obj["id"] = id;
    obj["displayName"] = displayName;
    obj["contentId"] = contentId;
    obj["status"] = jobStatusName(status);
    obj["progress"] = progress;
    if (hasExtractProgress()) obj["extractProgress"] = extractProgress;
    if (!error.isEmpty()) obj["error"] = error;
    if (errorKind != JobErrorKind::None) obj["errorKind"] = jobErrorKindName(errorKind);
    if (!speed.isEmpty()) obj["speed"] = speed;
    if (!eta.isEmpty()) obj["eta"] = eta;
    if (pid > 0) obj["pid"] = pid;
    if (!localPath.isEmpty()) obj["localPath"] = localPath;
    obj["addedAt"] = addedAt;
    return obj;
}

Job Job::fromJson(const QJsonObject& obj) {
    Job job;
    job.id = obj["id"].toString();
    job.displayName = obj["displayName"].toString();
    job.contentId = obj["contentId"].toString();
    job.status = jobStatusFromName(obj["status"].toString()).value_or(JobStatus::Queued);
    job.progress = qBound(0, obj["progress"].toInt(0), 100);
    if (obj.contains("extractProgress"))
        job.extractProgress = qBound(0, obj["extractProgress"].toInt(0), 100);
    job.error = obj["error"].toString();
    job.errorKind = jobErrorKindFromName(obj["errorKind"].toString());
    job.speed = obj["speed"].toString();
    job.eta = obj["eta"].toString();
    job.pid = obj["pid"].toVariant().toLongLong();
    job.localPath = obj["localPath"].toString();
    job.addedAt = obj["addedAt"].toVariant().toLongLong();
    return job;
}
