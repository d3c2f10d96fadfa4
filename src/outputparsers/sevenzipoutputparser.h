#ifndef SEVENZIPOUTPUTPARSER_H
#define SEVENZIPOUTPUTPARSER_H

#include "tooloutputparser.h"

// Parses 7-Zip's -bsp1 progress output (" 45% 12 - file.obb") and its
// error reports.
class SevenZipOutputParser : public ToolOutputParser {
public:
    QString toolName() const override { return "7z"; }
    ParsedLine parseLine(const QString& line) const override;

    static QString failureMessage(JobErrorKind kind);
};

#endif
