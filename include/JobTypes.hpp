#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

// One line of the config: Job = source | remote:path [| exclude]
struct JobSpec
{
    std::string Source;
    std::string Destination;
    std::string Exclude;
};

struct ValidatedJob
{
    JobSpec Spec;
    std::string RemoteToken; // "remote:" including the colon
};

using ProcessHandle = int;
constexpr ProcessHandle InvalidProcess = -1;

struct RunningJob
{
    int Index = 0; // 1-based, stable for the whole run
    ValidatedJob Job;
    ProcessHandle Handle = InvalidProcess;
    std::chrono::system_clock::time_point FirstStartTime; // kept across relaunches
    std::chrono::system_clock::time_point StartTime;      // current process
    std::chrono::system_clock::time_point FinishTime;
    double BandwidthCapKBs = 0.0;
    std::string LogPath;

    std::optional<int> ExitCode;
    bool FailureReported = false;

    // Heartbeat bookkeeping, carried over on relaunch
    std::uintmax_t LogReadOffset = 0;
    std::uintmax_t LogLineCount = 0;
    std::optional<double> LastProgress;

    bool IsAlive() const { return Handle != InvalidProcess && !ExitCode.has_value(); }
};
