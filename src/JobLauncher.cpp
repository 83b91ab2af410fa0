#include "JobLauncher.hpp"
#include "BandwidthPolicy.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>

namespace FS = std::filesystem;

// Sizing for bulk uploads of large, rarely modified files
constexpr const char* ChunkSize = "256M";
constexpr const char* BufferSize = "256M";
constexpr const char* MultiThreadCutoff = "256M";
constexpr const char* MultiThreadStreams = "8";
constexpr const char* StatsInterval = "60s";

JobLauncher::JobLauncher(ProcessLauncher& Launcher)
    : Launcher(Launcher),
      Sleep([](std::chrono::seconds Duration) { std::this_thread::sleep_for(Duration); }),
      Stagger(ConfigGlobal::LaunchStaggerSeconds),
      Parallelism(ParallelismForCores(std::thread::hardware_concurrency()))
{
}

void JobLauncher::SetSleepFunction(SleepFunction NewSleep)
{
    Sleep = std::move(NewSleep);
}

void JobLauncher::SetStagger(std::chrono::seconds Delay)
{
    Stagger = Delay;
}

unsigned int JobLauncher::ParallelismForCores(unsigned int Cores)
{
    if (Cores == 0)
    {
        return 16;
    }
    return std::min(32u, Cores * 8);
}

std::vector<std::string> JobLauncher::BuildInvocation(const ValidatedJob& Job, double BandwidthCapPerJobKBs, const std::string& LogPath) const
{
    std::vector<std::string> Args = {
        ConfigGlobal::EnginePath, "copy", Job.Spec.Source, Job.Spec.Destination,
        "--config", ConfigGlobal::EngineConfigPath,
        "--progress",
        "--size-only",
        "--transfers", std::to_string(Parallelism),
        "--checkers", std::to_string(Parallelism),
        "--drive-chunk-size", ChunkSize,
        "--buffer-size", BufferSize,
        "--multi-thread-cutoff", MultiThreadCutoff,
        "--multi-thread-streams", MultiThreadStreams,
        "--log-file", LogPath,
        "--log-level", "INFO",
        "--stats", StatsInterval,
        "--bwlimit", FormatRateLimit(BandwidthCapPerJobKBs)
    };

    if (!Job.Spec.Exclude.empty())
    {
        Args.push_back("--exclude");
        Args.push_back(Job.Spec.Exclude);
    }
    return Args;
}

void JobLauncher::BeginBatch()
{
    AnyStarted = false;
}

bool JobLauncher::LaunchOne(RunningJob& Slot, double BandwidthCapPerJobKBs)
{
    const std::string Tag = "[Job " + std::to_string(Slot.Index) + "] ";

    std::error_code ec;
    if (!FS::exists(Slot.Job.Spec.Source, ec))
    {
        Log.Warn(Tag + "Source " + Slot.Job.Spec.Source + " no longer exists, skipping");
        std::cerr << Tag << "Source " << Slot.Job.Spec.Source << " no longer exists, skipping\n";
        return false;
    }

    if (AnyStarted && Stagger.count() > 0)
    {
        Sleep(Stagger);
    }

    if (Slot.LogPath.empty())
    {
        Slot.LogPath = ConfigGlobal::EngineLogPathForJob(Slot.Index).string();
    }

    auto Args = BuildInvocation(Slot.Job, BandwidthCapPerJobKBs, Slot.LogPath);
    Log.Info(Tag + JoinCommandLine(Args));

    // Progress output goes to the job's log, which the heartbeat reads
    ProcessHandle Handle = Launcher.Spawn(Args, Slot.LogPath);
    AnyStarted = true;
    if (Handle == InvalidProcess)
    {
        Log.Error(Tag + "Failed to start transfer " + Slot.Job.Spec.Source + " -> " + Slot.Job.Spec.Destination);
        return false;
    }

    Slot.Handle = Handle;
    Slot.StartTime = std::chrono::system_clock::now();
    if (Slot.FirstStartTime.time_since_epoch().count() == 0)
    {
        Slot.FirstStartTime = Slot.StartTime;
    }
    Slot.BandwidthCapKBs = BandwidthCapPerJobKBs;
    Slot.ExitCode.reset();
    Slot.FailureReported = false;

    Log.Info(Tag + "Started pid " + std::to_string(Handle) + " at " + FormatRateLimit(BandwidthCapPerJobKBs) + "/s");
    std::cout << Tag << "Started " << Slot.Job.Spec.Source << " -> " << Slot.Job.Spec.Destination << "\n";
    return true;
}

std::vector<RunningJob> JobLauncher::Launch(const std::vector<ValidatedJob>& ValidJobs, double BandwidthCapPerJobKBs)
{
    std::vector<RunningJob> Running;
    BeginBatch();

    for (size_t i = 0; i < ValidJobs.size(); ++i)
    {
        RunningJob Slot;
        Slot.Index = static_cast<int>(i + 1);
        Slot.Job = ValidJobs[i];

        if (LaunchOne(Slot, BandwidthCapPerJobKBs))
        {
            Running.push_back(std::move(Slot));
        }
    }
    return Running;
}
