#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "JobTypes.hpp"

struct ProcessUsage
{
    double CpuSeconds = 0.0;
    std::uint64_t ResidentBytes = 0;
};

// Everything the supervisor needs from the OS process table.
// Tests substitute a fake so no real engine is started.
class ProcessLauncher
{
public:
    virtual ~ProcessLauncher() = default;

    // stdout and stderr are appended to OutputPath ("/dev/null" to discard).
    // Returns InvalidProcess if the program could not be started.
    virtual ProcessHandle Spawn(const std::vector<std::string>& Args, const std::string& OutputPath) = 0;

    // Exit code once the process has exited, nothing while it still runs.
    // A process killed by a signal reports 128 + signal number.
    virtual std::optional<int> Poll(ProcessHandle Handle) = 0;

    virtual int Wait(ProcessHandle Handle) = 0;

    // Hard stop (SIGKILL), does not reap
    virtual void Kill(ProcessHandle Handle) = 0;

    virtual std::optional<ProcessUsage> QueryUsage(ProcessHandle Handle) = 0;

    virtual bool IsProgramRunning(const std::string& ProgramName) = 0;

    // Spawn + Wait. Returns -1 when the program could not be started.
    int Run(const std::vector<std::string>& Args, const std::string& OutputPath);
};

class PosixProcessLauncher : public ProcessLauncher
{
public:
    ProcessHandle Spawn(const std::vector<std::string>& Args, const std::string& OutputPath) override;
    std::optional<int> Poll(ProcessHandle Handle) override;
    int Wait(ProcessHandle Handle) override;
    void Kill(ProcessHandle Handle) override;
    std::optional<ProcessUsage> QueryUsage(ProcessHandle Handle) override;
    bool IsProgramRunning(const std::string& ProgramName) override;

private:
    static int DecodeStatus(int Status);
};

std::string JoinCommandLine(const std::vector<std::string>& Args);
