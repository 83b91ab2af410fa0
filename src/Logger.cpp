#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& logDir)
{
    std::error_code ec;
    if (!FS::exists(logDir, ec))
    {
        FS::create_directories(logDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << logDir << ": " << ec.message() << "\n";
        }
    }

    CurrentLogFilePath = (FS::path(logDir) / ("Supervisor_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Supervisor Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Supervisor Finished at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (LogFile.is_open())
    {
        LogFile.close();
    }
    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

int Logger::PurgeExpiredLogs(unsigned short int RetentionDays)
{
    if (CurrentLogFilePath.empty())
    {
        return 0;
    }

    const FS::path Dir = FS::path(CurrentLogFilePath).parent_path();
    const auto Cutoff = FS::file_time_type::clock::now() - std::chrono::hours(24) * RetentionDays;

    int Removed = 0;
    int Failed = 0;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(Dir, ec))
    {
        std::error_code EntryEc;
        if (!Entry.is_regular_file(EntryEc) || Entry.path() == FS::path(CurrentLogFilePath))
        {
            continue;
        }

        auto WriteTime = Entry.last_write_time(EntryEc);
        if (EntryEc || WriteTime >= Cutoff)
        {
            continue;
        }

        if (FS::remove(Entry.path(), EntryEc))
        {
            ++Removed;
        }
        else
        {
            ++Failed;
        }
    }

    if (ec)
    {
        Warn("Log retention: could not list " + Dir.string() + ": " + ec.message());
    }
    if (Failed > 0)
    {
        Warn("Log retention: " + std::to_string(Failed) + " expired file(s) in " + Dir.string() + " could not be removed");
    }
    if (Removed > 0)
    {
        Info("Log retention: removed " + std::to_string(Removed) + " file(s) older than " + std::to_string(RetentionDays) + " day(s)");
    }
    return Removed;
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
