#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "JobTypes.hpp"
#include "ProcessLauncher.hpp"

class JobLauncher
{
public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;

    explicit JobLauncher(ProcessLauncher& Launcher);

    void SetSleepFunction(SleepFunction Sleep);
    void SetStagger(std::chrono::seconds Delay);

    // Indices are positions in ValidJobs + 1. Jobs whose source is gone or
    // that fail to spawn are left out of the result.
    std::vector<RunningJob> Launch(const std::vector<ValidatedJob>& ValidJobs, double BandwidthCapPerJobKBs);

    // No stagger before the first start of the next batch
    void BeginBatch();

    // Starts (or restarts) one slot, keeping its index and heartbeat state.
    // Returns false when the job could not be started.
    bool LaunchOne(RunningJob& Slot, double BandwidthCapPerJobKBs);

    std::vector<std::string> BuildInvocation(const ValidatedJob& Job, double BandwidthCapPerJobKBs, const std::string& LogPath) const;

    // min(32, cores * 8), 16 when the core count is unknown
    static unsigned int ParallelismForCores(unsigned int Cores);

private:
    ProcessLauncher& Launcher;
    SleepFunction Sleep;
    std::chrono::seconds Stagger;
    unsigned int Parallelism;
    bool AnyStarted = false;
};
