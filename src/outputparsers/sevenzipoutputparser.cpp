#include "sevenzipoutputparser.h"
#include <QRegularExpression>

ParsedLine SevenZipOutputParser::parseLine(const QString& line) const {
    static const QRegularExpression percentRe("^\\s*(\\d+)%");

    ParsedLine parsed;

    auto match = percentRe.match(line);
    if (match.hasMatch()) parsed.percent = qBound(0, match.captured(1).toInt(), 100);

    if (line.contains("Wrong password")) {
        parsed.failure = JobErrorKind::WrongPassword;
    } else if (line.contains("Data Error") || line.contains("CRC Failed")) {
        parsed.failure = JobErrorKind::DataCorruption;
    }

    return parsed;
}

QString SevenZipOutputParser::failureMessage(JobErrorKind kind) {
    switch (kind) {
    case JobErrorKind::WrongPassword:
        return "Wrong password";
    case JobErrorKind::DataCorruption:
        return "Data/CRC error";
    default:
        return "Extraction failed";
    }
}
