#pragma once

#include <string>
#include <vector>
#include "JobTypes.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<JobSpec>& GetJobs() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseJobLine(const std::string& Value, int LineNumber);
    bool ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned short int& Out);
    bool ParseHour(const std::string& Key, const std::string& Value, int LineNumber, unsigned short int& Out);
    bool ParseFraction(const std::string& Key, const std::string& Value, int LineNumber, double& Out);

    std::vector<JobSpec> Jobs;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
