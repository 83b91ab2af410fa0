#include "ProcessLauncher.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace FS = std::filesystem;

int ProcessLauncher::Run(const std::vector<std::string>& Args, const std::string& OutputPath)
{
    ProcessHandle Handle = Spawn(Args, OutputPath);
    if (Handle == InvalidProcess)
    {
        return -1;
    }
    return Wait(Handle);
}

std::string JoinCommandLine(const std::vector<std::string>& Args)
{
    std::string Line;
    for (size_t i = 0; i < Args.size(); i++)
    {
        if (i > 0)
        {
            Line += ' ';
        }
        Line += Args[i];
    }
    return Line;
}

ProcessHandle PosixProcessLauncher::Spawn(const std::vector<std::string>& Args, const std::string& OutputPath)
{
    if (Args.empty())
    {
        Log.Error("[Process] Refusing to spawn an empty command line");
        return InvalidProcess;
    }

    int OutFd = open(OutputPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (OutFd < 0)
    {
        Log.Error("[Process] Cannot open output file " + OutputPath + " for '" + Args[0] + "': " + std::strerror(errno));
        return InvalidProcess;
    }

    // The child writes errno here when execvp fails; a clean exec closes it.
    int ExecPipe[2];
    if (pipe2(ExecPipe, O_CLOEXEC) != 0)
    {
        Log.Error(std::string("[Process] pipe2 failed: ") + std::strerror(errno));
        close(OutFd);
        return InvalidProcess;
    }

    std::vector<char*> Argv;
    for (const auto& Arg : Args)
    {
        Argv.push_back(const_cast<char*>(Arg.c_str()));
    }
    Argv.push_back(nullptr);

    pid_t Pid = fork();
    if (Pid < 0)
    {
        Log.Error("[Process] fork failed for '" + Args[0] + "': " + std::strerror(errno));
        close(OutFd);
        close(ExecPipe[0]);
        close(ExecPipe[1]);
        return InvalidProcess;
    }

    if (Pid == 0)
    {
        int NullFd = open("/dev/null", O_RDONLY);
        if (NullFd >= 0)
        {
            dup2(NullFd, STDIN_FILENO);
        }
        dup2(OutFd, STDOUT_FILENO);
        dup2(OutFd, STDERR_FILENO);

        execvp(Argv[0], Argv.data());

        int Err = errno;
        ssize_t Ignored = write(ExecPipe[1], &Err, sizeof(Err));
        (void)Ignored;
        _exit(127);
    }

    close(OutFd);
    close(ExecPipe[1]);

    int ChildErr = 0;
    ssize_t Got;
    do
    {
        Got = read(ExecPipe[0], &ChildErr, sizeof(ChildErr));
    } while (Got < 0 && errno == EINTR);
    close(ExecPipe[0]);

    if (Got == static_cast<ssize_t>(sizeof(ChildErr)))
    {
        int Status = 0;
        waitpid(Pid, &Status, 0);
        Log.Error("[Process] Failed to start '" + Args[0] + "': " + std::strerror(ChildErr));
        return InvalidProcess;
    }

    return static_cast<ProcessHandle>(Pid);
}

int PosixProcessLauncher::DecodeStatus(int Status)
{
    if (WIFEXITED(Status))
    {
        return WEXITSTATUS(Status);
    }
    if (WIFSIGNALED(Status))
    {
        return 128 + WTERMSIG(Status);
    }
    return 1;
}

std::optional<int> PosixProcessLauncher::Poll(ProcessHandle Handle)
{
    int Status = 0;
    pid_t Result;
    do
    {
        Result = waitpid(static_cast<pid_t>(Handle), &Status, WNOHANG);
    } while (Result < 0 && errno == EINTR);

    if (Result == 0)
    {
        return std::nullopt;
    }
    if (Result < 0)
    {
        Log.Warn("[Process] waitpid failed for pid " + std::to_string(Handle) + ": " + std::strerror(errno) + ". Treating as exited.");
        return -1;
    }
    return DecodeStatus(Status);
}

int PosixProcessLauncher::Wait(ProcessHandle Handle)
{
    int Status = 0;
    pid_t Result;
    do
    {
        Result = waitpid(static_cast<pid_t>(Handle), &Status, 0);
    } while (Result < 0 && errno == EINTR);

    if (Result < 0)
    {
        Log.Warn("[Process] waitpid failed for pid " + std::to_string(Handle) + ": " + std::strerror(errno));
        return -1;
    }
    return DecodeStatus(Status);
}

void PosixProcessLauncher::Kill(ProcessHandle Handle)
{
    if (kill(static_cast<pid_t>(Handle), SIGKILL) != 0 && errno != ESRCH)
    {
        Log.Warn("[Process] kill failed for pid " + std::to_string(Handle) + ": " + std::strerror(errno));
    }
}

std::optional<ProcessUsage> PosixProcessLauncher::QueryUsage(ProcessHandle Handle)
{
    const std::string ProcDir = "/proc/" + std::to_string(Handle);

    std::ifstream StatFile(ProcDir + "/stat");
    std::string StatLine;
    if (!StatFile.is_open() || !std::getline(StatFile, StatLine))
    {
        return std::nullopt;
    }

    // comm may contain spaces, fields are counted from the last ')'
    size_t CommEnd = StatLine.rfind(')');
    if (CommEnd == std::string::npos)
    {
        return std::nullopt;
    }

    std::istringstream Fields(StatLine.substr(CommEnd + 1));
    std::vector<std::string> Tokens;
    std::string Token;
    while (Fields >> Token)
    {
        Tokens.push_back(Token);
    }
    // Tokens[0] is field 3 (state); utime and stime are fields 14 and 15
    if (Tokens.size() < 13)
    {
        return std::nullopt;
    }

    ProcessUsage Usage;
    try
    {
        const long Ticks = sysconf(_SC_CLK_TCK);
        const double TicksPerSecond = Ticks > 0 ? static_cast<double>(Ticks) : 100.0;
        Usage.CpuSeconds = (std::stod(Tokens[11]) + std::stod(Tokens[12])) / TicksPerSecond;

        std::ifstream StatmFile(ProcDir + "/statm");
        std::uint64_t SizePages = 0;
        std::uint64_t ResidentPages = 0;
        if (StatmFile >> SizePages >> ResidentPages)
        {
            Usage.ResidentBytes = ResidentPages * static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE));
        }
    }
    catch (const std::exception& e)
    {
        Log.Warn("[Process] Unreadable /proc stat for pid " + std::to_string(Handle) + ": " + e.what());
        return std::nullopt;
    }
    return Usage;
}

bool PosixProcessLauncher::IsProgramRunning(const std::string& ProgramName)
{
    // /proc/<pid>/comm holds at most 15 characters
    std::string Wanted = FS::path(ProgramName).filename().string().substr(0, 15);
    const std::string Self = std::to_string(getpid());

    std::error_code ec;
    for (const auto& Entry : FS::directory_iterator("/proc", ec))
    {
        const std::string Name = Entry.path().filename().string();
        if (Name.empty() || Name == Self || Name.find_first_not_of("0123456789") != std::string::npos)
        {
            continue;
        }

        std::ifstream CommFile(Entry.path() / "comm");
        std::string Comm;
        if (CommFile.is_open() && std::getline(CommFile, Comm) && Comm == Wanted)
        {
            Log.Info("[Process] Found running '" + Wanted + "' with pid " + Name);
            return true;
        }
    }
    if (ec)
    {
        Log.Warn("[Process] Could not scan /proc for '" + Wanted + "': " + ec.message());
    }
    return false;
}
