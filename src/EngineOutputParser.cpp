#include "EngineOutputParser.hpp"

#include <regex>

namespace
{
    const std::regex RatePattern(R"((\d+(?:\.\d+)?)\s*([KMG]i?B|B)/s)");
    const std::regex ProgressPattern(R"((\d{1,3}(?:\.\d+)?)%)");
}

std::optional<double> EngineOutputParser::RateToMbps(double Value, const std::string& Unit)
{
    double BytesPerUnit;
    if (Unit == "B")
    {
        BytesPerUnit = 1.0;
    }
    else if (Unit == "KB" || Unit == "KiB")
    {
        BytesPerUnit = 1e3;
    }
    else if (Unit == "MB" || Unit == "MiB")
    {
        BytesPerUnit = 1e6;
    }
    else if (Unit == "GB" || Unit == "GiB")
    {
        BytesPerUnit = 1e9;
    }
    else
    {
        return std::nullopt;
    }

    if (Value < 0.0)
    {
        return std::nullopt;
    }
    return Value * BytesPerUnit * 8.0 / 1e6;
}

std::optional<double> EngineOutputParser::ParseRate(const std::string& Line) const
{
    std::optional<double> Rate;
    for (auto It = std::sregex_iterator(Line.begin(), Line.end(), RatePattern); It != std::sregex_iterator(); ++It)
    {
        try
        {
            Rate = RateToMbps(std::stod((*It)[1].str()), (*It)[2].str());
        }
        catch (const std::exception&)
        {
            Rate = std::nullopt;
        }
    }
    return Rate;
}

std::optional<double> EngineOutputParser::ParseProgress(const std::string& Line) const
{
    std::optional<double> Percent;
    for (auto It = std::sregex_iterator(Line.begin(), Line.end(), ProgressPattern); It != std::sregex_iterator(); ++It)
    {
        try
        {
            double Value = std::stod((*It)[1].str());
            if (Value <= 100.0)
            {
                Percent = Value;
            }
        }
        catch (const std::exception&)
        {
            continue;
        }
    }
    return Percent;
}

std::optional<double> EngineOutputParser::ParseTransferProgress(const std::string& Line) const
{
    if (!ParseRate(Line))
    {
        return std::nullopt;
    }
    return ParseProgress(Line);
}
