#pragma once

#include <string>
#include <cstddef>

enum class BandwidthBucket
{
    Day,
    Night
};

struct BandwidthPolicy
{
    double MeasuredUploadMbps = 0.0;
    double DayFraction = 0.5;
    double NightFraction = 0.75;
    int DayStartHour = 6; // inclusive
    int DayEndHour = 18;  // exclusive

    BandwidthBucket BucketForHour(int Hour) const;
    double FractionFor(BandwidthBucket Bucket) const;

    // Mbps * fraction * 1000 / 8 / JobCount, in KB/s
    double PerJobCapKBs(int Hour, std::size_t JobCount) const;

    static BandwidthPolicy FromConfig(double MeasuredUploadMbps);
};

const char* BucketName(BandwidthBucket Bucket);

// Engine rate-limit argument, e.g. 312.5 -> "312.5K"
std::string FormatRateLimit(double CapKBs);

int CurrentLocalHour();
