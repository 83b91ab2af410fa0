#include "RunReport.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

RunReport RunReport::FromState(const SupervisorState& State)
{
    RunReport Report;
    Report.Interrupted = State.Interrupted;

    for (const auto& Job : State.Jobs)
    {
        JobOutcome Outcome;
        Outcome.Index = Job.Index;
        Outcome.Source = Job.Job.Spec.Source;
        Outcome.Destination = Job.Job.Spec.Destination;
        Outcome.LogPath = Job.LogPath;
        Outcome.ExitCode = Job.ExitCode;
        if (Job.ExitCode)
        {
            Outcome.Duration = std::chrono::duration_cast<std::chrono::seconds>(Job.FinishTime - Job.FirstStartTime);
        }
        Report.Outcomes.push_back(std::move(Outcome));
    }

    std::sort(Report.Outcomes.begin(), Report.Outcomes.end(), [](const JobOutcome& A, const JobOutcome& B)
    {
        return A.Index < B.Index;
    });
    return Report;
}

const std::vector<JobOutcome>& RunReport::GetOutcomes() const
{
    return Outcomes;
}

bool RunReport::AllSucceeded() const
{
    if (Interrupted || Outcomes.empty())
    {
        return false;
    }
    return std::all_of(Outcomes.begin(), Outcomes.end(), [](const JobOutcome& Outcome) { return Outcome.Succeeded(); });
}

int RunReport::ExitStatus() const
{
    return AllSucceeded() ? 0 : 1;
}

std::vector<std::string> RunReport::SummaryLines() const
{
    std::vector<std::string> Lines;
    for (const auto& Outcome : Outcomes)
    {
        std::ostringstream Line;
        Line << "Job " << Outcome.Index << " (" << Outcome.Source << " -> " << Outcome.Destination << "): ";
        if (Outcome.Succeeded())
        {
            long long Total = Outcome.Duration.count();
            Line << "succeeded in " << std::setfill('0') << std::setw(2) << Total / 3600 << ":"
                 << std::setw(2) << (Total / 60) % 60 << ":" << std::setw(2) << Total % 60;
        }
        else if (Outcome.ExitCode)
        {
            Line << "FAILED with exit code " << *Outcome.ExitCode << ", log: " << Outcome.LogPath;
        }
        else
        {
            Line << "FAILED, still running at shutdown, log: " << Outcome.LogPath;
        }
        Lines.push_back(Line.str());
    }

    if (Outcomes.empty())
    {
        Lines.push_back("No transfer was started.");
    }
    if (Interrupted)
    {
        Lines.push_back("Run was interrupted before all transfers finished.");
    }
    return Lines;
}

std::string RunReport::NotificationTitle() const
{
    return AllSucceeded() ? "SyncPilot: sync complete" : "SyncPilot: sync FAILED";
}

std::string RunReport::NotificationBody() const
{
    size_t Succeeded = std::count_if(Outcomes.begin(), Outcomes.end(), [](const JobOutcome& Outcome) { return Outcome.Succeeded(); });
    std::string Body = std::to_string(Succeeded) + " of " + std::to_string(Outcomes.size()) + " job(s) succeeded.";
    for (const auto& Outcome : Outcomes)
    {
        if (!Outcome.Succeeded())
        {
            Body += " Job " + std::to_string(Outcome.Index) + " failed, see " + Outcome.LogPath + ".";
        }
    }
    return Body;
}
