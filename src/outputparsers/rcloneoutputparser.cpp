#include "rcloneoutputparser.h"
#include <QRegularExpression>
#include <QDebug>

ParsedLine RcloneOutputParser::parseLine(const QString& line) const {
    static const QRegularExpression percentRe(", (\\d+)%, ");
    static const QRegularExpression speedRe(", (\\d+\\.\\d+ \\S+?B/s),");
    static const QRegularExpression etaRe(", ETA (\\S+)");

    ParsedLine parsed;

    auto percentMatch = percentRe.match(line);
    if (percentMatch.hasMatch()) {
        parsed.percent = qBound(0, percentMatch.captured(1).toInt(), 100);

        auto speedMatch = speedRe.match(line);
        if (speedMatch.hasMatch()) parsed.speed = speedMatch.captured(1);

        auto etaMatch = etaRe.match(line);
        if (etaMatch.hasMatch()) parsed.eta = etaMatch.captured(1);
    }

    if (line.contains("Auth Error") || line.contains("authentication failed", Qt::CaseInsensitive)) {
        parsed.failure = JobErrorKind::AuthFailure;
    }

    if (line.contains("doesn't support hash type")) {
        qWarning() << "[rclone] Remote does not support hash checks:" << line;
    }

    return parsed;
}
