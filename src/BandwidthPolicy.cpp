#include "BandwidthPolicy.hpp"
#include "ConfigGlobal.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

BandwidthBucket BandwidthPolicy::BucketForHour(int Hour) const
{
    return (Hour >= DayStartHour && Hour < DayEndHour) ? BandwidthBucket::Day : BandwidthBucket::Night;
}

double BandwidthPolicy::FractionFor(BandwidthBucket Bucket) const
{
    return Bucket == BandwidthBucket::Day ? DayFraction : NightFraction;
}

double BandwidthPolicy::PerJobCapKBs(int Hour, std::size_t JobCount) const
{
    if (JobCount == 0)
    {
        return 0.0;
    }
    return MeasuredUploadMbps * FractionFor(BucketForHour(Hour)) * 1000.0 / 8.0 / static_cast<double>(JobCount);
}

BandwidthPolicy BandwidthPolicy::FromConfig(double MeasuredUploadMbps)
{
    BandwidthPolicy Policy;
    Policy.MeasuredUploadMbps = MeasuredUploadMbps;
    Policy.DayFraction = ConfigGlobal::DayFraction;
    Policy.NightFraction = ConfigGlobal::NightFraction;
    Policy.DayStartHour = ConfigGlobal::DayStartHour;
    Policy.DayEndHour = ConfigGlobal::DayEndHour;
    return Policy;
}

const char* BucketName(BandwidthBucket Bucket)
{
    switch (Bucket)
    {
    case BandwidthBucket::Day:   return "day";
    case BandwidthBucket::Night: return "night";
    default:                     return "unknown";
    }
}

std::string FormatRateLimit(double CapKBs)
{
    // Plain decimal, never scientific notation, at most 3 decimals
    std::ostringstream Stream;
    Stream << std::fixed << std::setprecision(3) << CapKBs;
    std::string Text = Stream.str();
    Text.erase(Text.find_last_not_of('0') + 1);
    if (!Text.empty() && Text.back() == '.')
    {
        Text.pop_back();
    }
    return Text + "K";
}

int CurrentLocalHour()
{
    std::time_t Time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm Local{};
    localtime_r(&Time, &Local);
    return Local.tm_hour;
}
