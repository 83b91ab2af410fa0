#include "Supervisor.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace FS = std::filesystem;

namespace
{
    std::string FormatDuration(std::chrono::seconds Duration)
    {
        long long Total = Duration.count();
        std::ostringstream Stream;
        Stream << std::setfill('0') << std::setw(2) << Total / 3600 << ":"
               << std::setw(2) << (Total / 60) % 60 << ":"
               << std::setw(2) << Total % 60;
        return Stream.str();
    }

    std::string FormatWallClock(std::chrono::system_clock::time_point When)
    {
        std::time_t Time = std::chrono::system_clock::to_time_t(When);
        std::tm Local{};
        localtime_r(&Time, &Local);
        std::ostringstream Stream;
        Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
        return Stream.str();
    }
}

RunningJob* SupervisorState::FindJob(int Index)
{
    for (auto& Job : Jobs)
    {
        if (Job.Index == Index)
        {
            return &Job;
        }
    }
    return nullptr;
}

std::size_t SupervisorState::AliveCount() const
{
    std::size_t Count = 0;
    for (const auto& Job : Jobs)
    {
        if (Job.IsAlive())
        {
            ++Count;
        }
    }
    return Count;
}

Supervisor::Supervisor(ProcessLauncher& Processes, JobLauncher& Launcher, const EngineOutputParser& Parser)
    : Processes(Processes),
      Launcher(Launcher),
      Parser(Parser),
      CurrentHour(CurrentLocalHour),
      Sleep([](std::chrono::seconds Duration) { std::this_thread::sleep_for(Duration); }),
      StopRequested([] { return false; }),
      PollInterval(ConfigGlobal::PollIntervalSeconds),
      StallThreshold(std::chrono::minutes(ConfigGlobal::StallMinutes))
{
}

void Supervisor::SetHourFunction(HourFunction Hour)
{
    CurrentHour = std::move(Hour);
}

void Supervisor::SetSleepFunction(SleepFunction NewSleep)
{
    Sleep = std::move(NewSleep);
}

void Supervisor::SetStopFunction(StopFunction Stop)
{
    StopRequested = std::move(Stop);
}

void Supervisor::SetPollInterval(std::chrono::seconds Interval)
{
    PollInterval = Interval;
}

void Supervisor::SetStallThreshold(std::chrono::seconds Threshold)
{
    StallThreshold = Threshold;
}

SupervisorState Supervisor::Start(const std::vector<ValidatedJob>& ValidJobs, const BandwidthPolicy& Policy)
{
    SupervisorState State;
    State.Policy = Policy;
    State.ValidJobs = ValidJobs;

    const int Hour = CurrentHour();
    State.ActiveBucket = Policy.BucketForHour(Hour);
    State.ActiveCapKBs = Policy.PerJobCapKBs(Hour, ValidJobs.size());

    Log.Info("[Supervisor] " + std::string(BucketName(State.ActiveBucket)) + " window, cap " + FormatRateLimit(State.ActiveCapKBs) + "/s per job for " + std::to_string(ValidJobs.size()) + " job(s)");

    State.Jobs = Launcher.Launch(State.ValidJobs, State.ActiveCapKBs);
    State.Phase = State.AliveCount() > 0 ? SupervisorPhase::Running : SupervisorPhase::Drained;
    return State;
}

void Supervisor::ReapExited(SupervisorState& State, TickReport& Report)
{
    for (auto& Job : State.Jobs)
    {
        if (!Job.IsAlive())
        {
            continue;
        }

        auto Code = Processes.Poll(Job.Handle);
        if (!Code)
        {
            continue;
        }

        Job.ExitCode = *Code;
        Job.FinishTime = std::chrono::system_clock::now();
        const std::string Tag = "[Job " + std::to_string(Job.Index) + "] ";
        if (*Code == 0)
        {
            Log.Info(Tag + "Finished successfully after " + FormatDuration(std::chrono::duration_cast<std::chrono::seconds>(Job.FinishTime - Job.FirstStartTime)));
            std::cout << Tag << "Finished " << Job.Job.Spec.Source << "\n";
        }
        else if (!Job.FailureReported)
        {
            Job.FailureReported = true;
            Report.FailedJobs.push_back(Job.Index);
            Log.Warn(Tag + "Transfer " + Job.Job.Spec.Source + " -> " + Job.Job.Spec.Destination + " exited with code " + std::to_string(*Code) + ", see " + Job.LogPath);
            std::cerr << Tag << "Exited with code " << *Code << ", see " << Job.LogPath << "\n";
        }
    }
}

bool Supervisor::CheckBucket(SupervisorState& State)
{
    const int Hour = CurrentHour();
    const BandwidthBucket Bucket = State.Policy.BucketForHour(Hour);
    if (Bucket == State.ActiveBucket)
    {
        return false;
    }

    const double NewCap = State.Policy.PerJobCapKBs(Hour, State.ValidJobs.size());
    Log.Info("[Supervisor] Bandwidth window changed from " + std::string(BucketName(State.ActiveBucket)) + " to " + BucketName(Bucket) + " at hour " + std::to_string(Hour));
    State.ActiveBucket = Bucket;

    if (NewCap == State.ActiveCapKBs)
    {
        return false;
    }
    if (State.AliveCount() == 0)
    {
        State.ActiveCapKBs = NewCap;
        return false;
    }

    Relaunch(State, NewCap);
    return true;
}

void Supervisor::Relaunch(SupervisorState& State, double NewCapKBs)
{
    State.Phase = SupervisorPhase::Relaunching;
    Log.Info("[Supervisor] Relaunching fleet: cap " + FormatRateLimit(State.ActiveCapKBs) + "/s -> " + FormatRateLimit(NewCapKBs) + "/s per job");
    std::cout << "Bandwidth window changed, restarting transfers at " << FormatRateLimit(NewCapKBs) << "/s per job\n";

    std::vector<int> Restart;
    for (const auto& Job : State.Jobs)
    {
        if (Job.IsAlive())
        {
            Restart.push_back(Job.Index);
        }
    }

    // The whole old set is gone before anything new starts
    StopAll(State);

    State.ActiveCapKBs = NewCapKBs;
    Launcher.BeginBatch();
    for (int Index : Restart)
    {
        RunningJob* Job = State.FindJob(Index);
        if (Job == nullptr)
        {
            continue;
        }
        if (!Launcher.LaunchOne(*Job, NewCapKBs))
        {
            Log.Warn("[Job " + std::to_string(Index) + "] Not restarted after bandwidth change, keeping exit code " + std::to_string(Job->ExitCode.value_or(-1)));
        }
    }

    ++State.RelaunchCount;
    State.Phase = State.AliveCount() > 0 ? SupervisorPhase::Running : SupervisorPhase::Drained;
}

void Supervisor::StopAll(SupervisorState& State)
{
    for (auto& Job : State.Jobs)
    {
        if (Job.IsAlive())
        {
            Processes.Kill(Job.Handle);
        }
    }
    for (auto& Job : State.Jobs)
    {
        if (Job.IsAlive())
        {
            Job.ExitCode = Processes.Wait(Job.Handle);
            Job.FinishTime = std::chrono::system_clock::now();
            Job.FailureReported = true;
            Log.Info("[Job " + std::to_string(Job.Index) + "] Stopped pid " + std::to_string(Job.Handle));
        }
    }
}

void Supervisor::ReadNewLogLines(RunningJob& Job)
{
    std::ifstream In(Job.LogPath, std::ios::binary);
    if (!In.is_open())
    {
        return;
    }

    In.seekg(0, std::ios::end);
    const std::streamoff Size = In.tellg();
    if (Size < 0)
    {
        return;
    }
    if (static_cast<std::uintmax_t>(Size) < Job.LogReadOffset)
    {
        // Truncated under us, start over
        Job.LogReadOffset = 0;
        Job.LogLineCount = 0;
    }

    In.seekg(static_cast<std::streamoff>(Job.LogReadOffset));
    std::string Chunk(static_cast<size_t>(Size - static_cast<std::streamoff>(Job.LogReadOffset)), '\0');
    In.read(Chunk.data(), static_cast<std::streamsize>(Chunk.size()));
    Chunk.resize(static_cast<size_t>(In.gcount()));

    // Only complete lines are consumed
    size_t LastNewline = Chunk.rfind('\n');
    if (LastNewline == std::string::npos)
    {
        return;
    }

    std::string Segment;
    for (size_t i = 0; i <= LastNewline; ++i)
    {
        char Ch = Chunk[i];
        if (Ch == '\n' || Ch == '\r')
        {
            if (Ch == '\n')
            {
                ++Job.LogLineCount;
            }
            if (auto Percent = Parser.ParseTransferProgress(Segment))
            {
                Job.LastProgress = Percent;
            }
            Segment.clear();
            continue;
        }
        Segment += Ch;
    }
    Job.LogReadOffset += LastNewline + 1;
}

JobHeartbeat Supervisor::Heartbeat(RunningJob& Job)
{
    JobHeartbeat Beat;
    Beat.Index = Job.Index;
    Beat.Elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - Job.FirstStartTime);
    Beat.Usage = Processes.QueryUsage(Job.Handle);

    ReadNewLogLines(Job);
    Beat.LogLines = Job.LogLineCount;
    Beat.Progress = Job.LastProgress;

    std::error_code ec;
    auto WriteTime = FS::last_write_time(Job.LogPath, ec);
    if (!ec)
    {
        auto Age = std::chrono::duration_cast<std::chrono::seconds>(FS::file_time_type::clock::now() - WriteTime);
        Beat.LogAge = Age;
        Beat.Stalled = Age > StallThreshold;
    }
    return Beat;
}

void Supervisor::LogHeartbeat(const RunningJob& Job, const JobHeartbeat& Beat)
{
    std::ostringstream Line;
    Line << "[Job " << Job.Index << "] alive " << FormatDuration(Beat.Elapsed);

    if (Beat.Usage)
    {
        Line << " | cpu " << std::fixed << std::setprecision(1) << Beat.Usage->CpuSeconds << "s"
             << " | rss " << std::setprecision(1) << static_cast<double>(Beat.Usage->ResidentBytes) / (1024.0 * 1024.0) << " MiB";
    }
    else
    {
        Line << " | cpu unknown | rss unknown";
    }

    Line << " | log " << Beat.LogLines << " lines";
    if (Beat.LogAge)
    {
        Line << ", last write " << FormatWallClock(std::chrono::system_clock::now() - *Beat.LogAge);
    }
    else
    {
        Line << ", last write unknown";
    }

    if (Beat.Progress)
    {
        Line << " | progress " << std::setprecision(0) << *Beat.Progress << "%";
    }
    else
    {
        Line << " | progress unknown";
    }

    Log.Info(Line.str());
}

TickReport Supervisor::Tick(SupervisorState& State)
{
    TickReport Report;

    ReapExited(State, Report);
    Report.Relaunched = CheckBucket(State);

    for (auto& Job : State.Jobs)
    {
        if (!Job.IsAlive())
        {
            continue;
        }

        try
        {
            JobHeartbeat Beat = Heartbeat(Job);
            LogHeartbeat(Job, Beat);

            if (Beat.Stalled)
            {
                Report.StalledJobs.push_back(Job.Index);
                Log.Warn("[Job " + std::to_string(Job.Index) + "] No log activity for " + FormatDuration(*Beat.LogAge) + " while pid " + std::to_string(Job.Handle) + " is alive. Check network and engine health, log: " + Job.LogPath);
            }
            Report.Heartbeats.push_back(std::move(Beat));
        }
        catch (const std::exception& e)
        {
            Log.Warn("[Job " + std::to_string(Job.Index) + "] Heartbeat failed: " + e.what());
        }
    }

    if (State.AliveCount() == 0)
    {
        State.Phase = SupervisorPhase::Drained;
    }
    return Report;
}

void Supervisor::Run(SupervisorState& State)
{
    while (State.Phase != SupervisorPhase::Drained)
    {
        if (StopRequested())
        {
            Log.Warn("[Supervisor] Stop requested, terminating " + std::to_string(State.AliveCount()) + " transfer(s)");
            std::cerr << "Stop requested, terminating transfers\n";
            State.Interrupted = true;
            StopAll(State);
            State.Phase = SupervisorPhase::Drained;
            break;
        }

        Tick(State);
        if (State.Phase == SupervisorPhase::Drained)
        {
            break;
        }
        Sleep(PollInterval);
    }
    Log.Info("[Supervisor] All transfers have exited");
}
