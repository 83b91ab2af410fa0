#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "BandwidthPolicy.hpp"
#include "EngineOutputParser.hpp"
#include "JobLauncher.hpp"
#include "JobTypes.hpp"
#include "ProcessLauncher.hpp"

enum class SupervisorPhase
{
    Running,
    Relaunching,
    Drained
};

// All mutable run state, owned by the single supervising thread
struct SupervisorState
{
    BandwidthPolicy Policy;
    std::vector<ValidatedJob> ValidJobs; // fixed for the run, never re-probed
    std::vector<RunningJob> Jobs;        // ordered by Index
    BandwidthBucket ActiveBucket = BandwidthBucket::Day;
    double ActiveCapKBs = 0.0;
    SupervisorPhase Phase = SupervisorPhase::Running;
    int RelaunchCount = 0;
    bool Interrupted = false;

    RunningJob* FindJob(int Index);
    std::size_t AliveCount() const;
};

struct JobHeartbeat
{
    int Index = 0;
    std::chrono::seconds Elapsed{ 0 };
    std::optional<ProcessUsage> Usage;
    std::uintmax_t LogLines = 0;
    std::optional<std::chrono::seconds> LogAge; // since last write
    std::optional<double> Progress;
    bool Stalled = false;
};

struct TickReport
{
    bool Relaunched = false;
    std::vector<JobHeartbeat> Heartbeats;
    std::vector<int> FailedJobs;  // newly observed non-zero exits
    std::vector<int> StalledJobs;
};

class Supervisor
{
public:
    using HourFunction = std::function<int()>;
    using SleepFunction = std::function<void(std::chrono::seconds)>;
    using StopFunction = std::function<bool()>;

    Supervisor(ProcessLauncher& Processes, JobLauncher& Launcher, const EngineOutputParser& Parser);

    void SetHourFunction(HourFunction Hour);
    void SetSleepFunction(SleepFunction Sleep);
    void SetStopFunction(StopFunction Stop);
    void SetPollInterval(std::chrono::seconds Interval);
    void SetStallThreshold(std::chrono::seconds Threshold);

    // Computes the first cap and launches the fleet
    SupervisorState Start(const std::vector<ValidatedJob>& ValidJobs, const BandwidthPolicy& Policy);

    // One poll cycle: reap exits, bucket check, heartbeats, stall warnings
    TickReport Tick(SupervisorState& State);

    // Ticks until every tracked process has exited or a stop is requested
    void Run(SupervisorState& State);

    // Hard stop every live process and reap it
    void StopAll(SupervisorState& State);

private:
    ProcessLauncher& Processes;
    JobLauncher& Launcher;
    const EngineOutputParser& Parser;

    HourFunction CurrentHour;
    SleepFunction Sleep;
    StopFunction StopRequested;
    std::chrono::seconds PollInterval;
    std::chrono::seconds StallThreshold;

    void ReapExited(SupervisorState& State, TickReport& Report);
    bool CheckBucket(SupervisorState& State);
    void Relaunch(SupervisorState& State, double NewCapKBs);
    JobHeartbeat Heartbeat(RunningJob& Job);
    void ReadNewLogLines(RunningJob& Job);
    void LogHeartbeat(const RunningJob& Job, const JobHeartbeat& Beat);
};
