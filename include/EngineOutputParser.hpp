#pragma once

#include <string>
#include <optional>

// Reads the soft textual contract of the transfer engine's log lines.
// Anything not recognised yields nothing rather than an error.
class EngineOutputParser
{
public:
    virtual ~EngineOutputParser() = default;

    // Last "<value><unit>/s" annotation on the line, in megabits per second
    virtual std::optional<double> ParseRate(const std::string& Line) const;

    // Last "<value>%" annotation on the line
    virtual std::optional<double> ParseProgress(const std::string& Line) const;

    // Progress from a byte-transfer stats line, i.e. one that also carries a rate.
    // File-count lines ("Transferred: 3 / 10, 30%") are ignored.
    virtual std::optional<double> ParseTransferProgress(const std::string& Line) const;

    // Unit is B, KB, MB, GB (KiB, MiB, GiB accepted), decimal 1000x steps
    static std::optional<double> RateToMbps(double Value, const std::string& Unit);
};
