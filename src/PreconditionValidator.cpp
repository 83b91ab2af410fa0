#include "PreconditionValidator.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace FS = std::filesystem;

namespace
{
    bool DirectoryReachable(const std::string& Path)
    {
        std::error_code ec;
        return FS::is_directory(Path, ec) && !ec;
    }
}

PreconditionValidator::PreconditionValidator(ProcessLauncher& Launcher)
    : Launcher(Launcher),
      Sleep([](std::chrono::seconds Duration) { std::this_thread::sleep_for(Duration); }),
      VolumeReachable(DirectoryReachable),
      StopRequested([] { return false; })
{
}

void PreconditionValidator::SetSleepFunction(SleepFunction NewSleep)
{
    Sleep = std::move(NewSleep);
}

void PreconditionValidator::SetPathProbe(PathProbe Probe)
{
    VolumeReachable = std::move(Probe);
}

void PreconditionValidator::SetStopFunction(StopFunction Stop)
{
    StopRequested = std::move(Stop);
}

const std::vector<std::string>& PreconditionValidator::GetErrors() const
{
    return Errors;
}

std::chrono::seconds PreconditionValidator::GetTotalSlept() const
{
    return TotalSlept;
}

void PreconditionValidator::AddError(const std::string& Message)
{
    Errors.push_back(Message);
    Log.Error("[Precondition] " + Message);
}

bool PreconditionValidator::IsExecutableOnPath(const std::string& Program)
{
    if (Program.find('/') != std::string::npos)
    {
        return access(Program.c_str(), X_OK) == 0 && !FS::is_directory(Program);
    }

    const char* PathEnv = std::getenv("PATH");
    if (PathEnv == nullptr)
    {
        return false;
    }

    std::stringstream Dirs(PathEnv);
    std::string Dir;
    while (std::getline(Dirs, Dir, ':'))
    {
        if (Dir.empty())
        {
            continue;
        }
        FS::path Candidate = FS::path(Dir) / Program;
        std::error_code ec;
        if (FS::is_regular_file(Candidate, ec) && access(Candidate.c_str(), X_OK) == 0)
        {
            return true;
        }
    }
    return false;
}

bool PreconditionValidator::CheckNoCompetingInstance()
{
    const std::string Program = FS::path(ConfigGlobal::EnginePath).filename().string();
    if (Launcher.IsProgramRunning(Program))
    {
        AddError("Another '" + Program + "' process is already running on this host. Wait for it to finish or stop it.");
        return false;
    }
    return true;
}

bool PreconditionValidator::CheckEngineFiles()
{
    bool Ok = true;
    if (!IsExecutableOnPath(ConfigGlobal::EnginePath))
    {
        AddError("Transfer engine not found or not executable: " + ConfigGlobal::EnginePath);
        Ok = false;
    }

    std::error_code ec;
    if (!FS::is_regular_file(ConfigGlobal::EngineConfigPath, ec))
    {
        AddError("Transfer engine config not found: " + ConfigGlobal::EngineConfigPath);
        Ok = false;
    }
    return Ok;
}

bool PreconditionValidator::WaitForSourceVolume(const std::string& VolumePath, unsigned short int MaxAttempts)
{
    for (unsigned short int Attempt = 1; Attempt <= MaxAttempts; ++Attempt)
    {
        if (VolumeReachable(VolumePath))
        {
            if (Attempt > 1)
            {
                Log.Info("[Precondition] Source volume " + VolumePath + " reachable after " + std::to_string(Attempt) + " attempts");
            }
            return true;
        }

        if (Attempt == MaxAttempts)
        {
            break;
        }

        std::chrono::seconds Delay(6 * Attempt);
        Log.Warn("[Precondition] Source volume " + VolumePath + " unreachable (attempt " + std::to_string(Attempt) + "/" + std::to_string(MaxAttempts) + "), retrying in " + std::to_string(Delay.count()) + "s");
        Sleep(Delay);
        TotalSlept += Delay;

        if (StopRequested())
        {
            AddError("Stop requested while waiting for source volume " + VolumePath + ".");
            return false;
        }
    }

    AddError("Source volume " + VolumePath + " unreachable after " + std::to_string(MaxAttempts) + " attempts. Check that the share is mounted.");
    return false;
}

bool PreconditionValidator::CheckConnectivity(const std::string& Host)
{
    int Code = Launcher.Run({ "ping", "-c", "1", "-W", "5", Host }, "/dev/null");
    if (Code != 0)
    {
        Log.Warn("[Precondition] Connectivity check against " + Host + " failed (exit " + std::to_string(Code) + "). Continuing, destination probes decide.");
        return false;
    }
    Log.Info("[Precondition] Connectivity to " + Host + " confirmed");
    return true;
}

bool PreconditionValidator::ValidateHost()
{
    return CheckNoCompetingInstance()
        && CheckEngineFiles()
        && WaitForSourceVolume(ConfigGlobal::SourceVolumePath, ConfigGlobal::MaxVolumeWaitAttempts);
}
