#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace
{
    std::string Trim(std::string Text)
    {
        // Trim leading whitespace
        Text.erase(Text.begin(), std::find_if(Text.begin(), Text.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Text.erase(std::find_if(Text.rbegin(), Text.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Text.end());
        return Text;
    }
}

const std::vector<JobSpec>& ConfigParser::GetJobs() const
{
    return Jobs;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Jobs.clear();
    Errors.clear();
    Infos.clear();

    const std::string ConfigFile = ConfigGlobal::ConfigFile;
    const bool Silent = ConfigGlobal::Silent;
    const unsigned short int RetentionDays = ConfigGlobal::LogRetentionDays;
    const std::string TargetHost = ConfigGlobal::TargetHostOverride;

    ConfigGlobal::InitializeDefaults();

    // CLI-owned settings survive a re-parse
    ConfigGlobal::ConfigFile = ConfigFile;
    ConfigGlobal::Silent = Silent;
    ConfigGlobal::LogRetentionDays = RetentionDays;
    ConfigGlobal::TargetHostOverride = TargetHost;
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::ParseJobLine(const std::string& Value, int LineNumber)
{
    std::vector<std::string> Fields;
    std::stringstream Stream(Value);
    std::string Field;
    while (std::getline(Stream, Field, '|'))
    {
        Fields.push_back(Trim(Field));
    }

    if (Fields.size() < 2 || Fields.size() > 3)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Job must be 'source | remote:path' with an optional '| exclude'.");
        return false;
    }

    JobSpec Spec;
    Spec.Source = Fields[0];
    Spec.Destination = Fields[1];
    if (Fields.size() == 3)
    {
        Spec.Exclude = Fields[2];
    }

    if (Spec.Source.empty())
    {
        AddError("Line " + std::to_string(LineNumber) + ": Job source is empty.");
        return false;
    }
    if (Spec.Destination.empty())
    {
        AddError("Line " + std::to_string(LineNumber) + ": Job destination is empty for source '" + Spec.Source + "'.");
        return false;
    }

    for (const auto& Existing : Jobs)
    {
        if (Existing.Source == Spec.Source && Existing.Destination == Spec.Destination)
        {
            AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate job '" + Spec.Source + " -> " + Spec.Destination + "'. Ignored.");
            return true;
        }
    }

    Jobs.push_back(std::move(Spec));
    return true;
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned short int& Out)
{
    try
    {
        size_t Used = 0;
        int ValueNum = std::stoi(Value, &Used);
        if (Used != Value.size() || ValueNum <= 0 || ValueNum > 65535)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be between 1 and 65,535.");
            return false;
        }
        Out = static_cast<unsigned short int>(ValueNum);
        AddInfo(Key + " set to " + std::to_string(ValueNum));
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::ParseHour(const std::string& Key, const std::string& Value, int LineNumber, unsigned short int& Out)
{
    try
    {
        size_t Used = 0;
        int ValueNum = std::stoi(Value, &Used);
        if (Used != Value.size() || ValueNum < 0 || ValueNum > 24)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be an hour between 0 and 24.");
            return false;
        }
        Out = static_cast<unsigned short int>(ValueNum);
        AddInfo(Key + " set to " + std::to_string(ValueNum));
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid hour for " + Key + ".");
        return false;
    }
}

bool ConfigParser::ParseFraction(const std::string& Key, const std::string& Value, int LineNumber, double& Out)
{
    try
    {
        size_t Used = 0;
        double ValueNum = std::stod(Value, &Used);
        if (Used != Value.size() || ValueNum <= 0.0)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be a positive number.");
            return false;
        }
        Out = ValueNum;
        AddInfo(Key + " set to " + Value);
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::unordered_set<std::string> SeenKeys;
    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        Line = Trim(Line);
        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Trim(Line.substr(EqualPos + 1));

        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());

        if (Key != "Job" && !SeenKeys.insert(Key).second)
        {
            AddError("Line " + std::to_string(LineNumber) + ": Key '" + Key + "' given more than once.");
            continue;
        }

        if (Key == "Job")
        {
            ParseJobLine(Value, LineNumber);
        }

        else if (Key == "SourceVolume" || Key == "EnginePath" || Key == "EngineConfig" || Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": " + Key + " is empty.");
                continue;
            }
            if (Key == "SourceVolume")
            {
                ConfigGlobal::SourceVolumePath = Value;
            }
            else if (Key == "EnginePath")
            {
                ConfigGlobal::EnginePath = Value;
            }
            else if (Key == "EngineConfig")
            {
                ConfigGlobal::EngineConfigPath = Value;
            }
            else
            {
                ConfigGlobal::LogDir = Value;
            }
        }

        else if (Key == "MaxVolumeWaitAttempts")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::MaxVolumeWaitAttempts);
        }

        else if (Key == "PollIntervalSeconds")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::PollIntervalSeconds);
        }

        else if (Key == "StallMinutes")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::StallMinutes);
        }

        else if (Key == "LaunchStaggerSeconds")
        {
            ParseCount(Key, Value, LineNumber, ConfigGlobal::LaunchStaggerSeconds);
        }

        else if (Key == "DayStartHour")
        {
            ParseHour(Key, Value, LineNumber, ConfigGlobal::DayStartHour);
        }

        else if (Key == "DayEndHour")
        {
            ParseHour(Key, Value, LineNumber, ConfigGlobal::DayEndHour);
        }

        else if (Key == "DayFraction")
        {
            ParseFraction(Key, Value, LineNumber, ConfigGlobal::DayFraction);
        }

        else if (Key == "NightFraction")
        {
            ParseFraction(Key, Value, LineNumber, ConfigGlobal::NightFraction);
        }

        else if (Key == "FallbackUploadMbps")
        {
            ParseFraction(Key, Value, LineNumber, ConfigGlobal::FallbackUploadMbps);
        }

        else if (Key == "ConnectivityHost")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": ConnectivityHost is empty.");
                continue;
            }
            ConfigGlobal::ConnectivityHost = Value;
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    for (const char* Required : { "SourceVolume", "EnginePath", "EngineConfig", "LogDir", "MaxVolumeWaitAttempts" })
    {
        if (SeenKeys.find(Required) == SeenKeys.end())
        {
            AddError(std::string("Missing required key '") + Required + "'.");
        }
    }

    if ((SeenKeys.count("DayFraction") && ConfigGlobal::DayFraction > 1.0) || (SeenKeys.count("NightFraction") && ConfigGlobal::NightFraction > 1.0))
    {
        AddError("DayFraction and NightFraction must not exceed 1.0.");
    }

    if (ConfigGlobal::DayStartHour >= ConfigGlobal::DayEndHour)
    {
        AddError("DayStartHour (" + std::to_string(ConfigGlobal::DayStartHour) + ") must be before DayEndHour (" + std::to_string(ConfigGlobal::DayEndHour) + ").");
    }

    if (Jobs.empty())
    {
        AddError("No jobs provided.");
    }

    return Errors.empty();  // Return false only if fatal errors present
}
