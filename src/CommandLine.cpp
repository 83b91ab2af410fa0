#include "CommandLine.hpp"
#include "ConfigGlobal.hpp"

#include <exception>
#include <string>

CommandLineResult ParseCommandLine(const std::vector<std::string>& Args)
{
    CommandLineResult Result;

    for (size_t i = 0; i < Args.size(); i++)
    {
        const std::string& Arg = Args[i];
        if (Arg == "--config")
        {
            if (i + 1 >= Args.size())
            {
                return { CommandLineAction::UsageError, "--config requires a path" };
            }
            ConfigGlobal::ConfigFile = Args[++i];
        }
        else if (Arg == "--target-host")
        {
            if (i + 1 >= Args.size())
            {
                return { CommandLineAction::UsageError, "--target-host requires a host name" };
            }
            ConfigGlobal::TargetHostOverride = Args[++i];
        }
        else if (Arg == "--silent")
        {
            ConfigGlobal::Silent = true;
        }
        else if (Arg == "--log-retention-days")
        {
            if (i + 1 >= Args.size() || !ParsePositive(Args[i + 1], ConfigGlobal::LogRetentionDays))
            {
                return { CommandLineAction::UsageError, "--log-retention-days requires a positive integer" };
            }
            ++i;
        }
        else if (Arg == "--help" || Arg == "-h")
        {
            Result.Action = CommandLineAction::ShowHelp;
            return Result;
        }
        else if (Arg == "--version")
        {
            Result.Action = CommandLineAction::ShowVersion;
            return Result;
        }
        else
        {
            return { CommandLineAction::UsageError, "unknown option " + Arg };
        }
    }
    return Result;
}

bool ParsePositive(const std::string& Text, unsigned short int& Out)
{
    try
    {
        size_t Used = 0;
        int Value = std::stoi(Text, &Used);
        if (Used != Text.size() || Value <= 0 || Value > 65535)
        {
            return false;
        }
        Out = static_cast<unsigned short int>(Value);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::string UsageText()
{
    return "Usage: SyncPilot [--config <path>] [--target-host <host>] [--silent]\n"
           "                 [--log-retention-days <days>] [--help] [--version]\n";
}
