#ifndef RCLONEOUTPUTPARSER_H
#define RCLONEOUTPUTPARSER_H

#include "tooloutputparser.h"

// Parses rclone's --stats-one-line output, e.g.
// "Transferred:   1.234 GiB / 2.000 GiB, 62%, 10.512 MiB/s, ETA 1m15s"
class RcloneOutputParser : public ToolOutputParser {
public:
    QString toolName() const override { return "rclone"; }
    ParsedLine parseLine(const QString& line) const override;
};

#endif
