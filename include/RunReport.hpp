#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "Supervisor.hpp"

struct JobOutcome
{
    int Index = 0;
    std::string Source;
    std::string Destination;
    std::string LogPath;
    std::optional<int> ExitCode;
    std::chrono::seconds Duration{ 0 };

    bool Succeeded() const { return ExitCode.has_value() && *ExitCode == 0; }
};

class RunReport
{
public:
    static RunReport FromState(const SupervisorState& State);

    // False when nothing ran, any job failed, or the run was interrupted
    bool AllSucceeded() const;
    int ExitStatus() const;

    std::vector<std::string> SummaryLines() const;
    std::string NotificationTitle() const;
    std::string NotificationBody() const;

    const std::vector<JobOutcome>& GetOutcomes() const;

private:
    std::vector<JobOutcome> Outcomes;
    bool Interrupted = false;
};
