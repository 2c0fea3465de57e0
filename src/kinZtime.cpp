#include "kinZtime.hpp"
#include <algorithm> // For std::minmax_element
#include <cctype>    // For std::isdigit
#include <cstdio>    // For std::sscanf, std::snprintf

namespace {

using DayDuration = std::chrono::duration<double, std::ratio<86400>>;
using Microseconds = std::chrono::microseconds;

// Days since 1970-01-01 of a proleptic Gregorian date.
long long days_from_civil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civil_from_days(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

} // namespace

bool parse_timestamp(const std::string& text, TimePoint& out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char separator = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &month, &day, &separator, &hour, &minute, &second, &consumed) != 7) {
        return false;
    }
    if (separator != 'T' && separator != ' ') {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 60 || hour < 0 || minute < 0 || second < 0) {
        return false;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long micro = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micro = micro * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 6; ++digits) {
            micro *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return false;
    }

    const long long days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const long long seconds = days * 86400LL + hour * 3600LL + minute * 60LL + second;
    out = TimePoint(std::chrono::duration_cast<TimePoint::duration>(Microseconds(seconds * 1000000LL + micro)));
    return true;
}

std::string format_timestamp(TimePoint t) {
    const long long total_us = std::chrono::floor<Microseconds>(t.time_since_epoch()).count();
    long long seconds = total_us / 1000000LL;
    long long micro = total_us % 1000000LL;
    if (micro < 0) {
        micro += 1000000LL;
        seconds -= 1;
    }
    long long days = seconds / 86400LL;
    long long sod = seconds % 86400LL;
    if (sod < 0) {
        sod += 86400LL;
        days -= 1;
    }
    long long year = 0;
    unsigned month = 0, day = 0;
    civil_from_days(days, year, month, day);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lld",
                  year, month, day, sod / 3600, (sod % 3600) / 60, sod % 60, micro);
    return buffer;
}

double offset_in_days(TimePoint origin, TimePoint t) {
    return std::chrono::duration_cast<DayDuration>(t - origin).count();
}

TimePoint denormalize_offset(TimePoint origin, double offset_days) {
    return origin + std::chrono::round<TimePoint::duration>(DayDuration(offset_days));
}

std::vector<double> linspace(double start, double stop, size_t count) {
    std::vector<double> values;
    if (count == 0) {
        return values;
    }
    values.reserve(count);
    if (count == 1) {
        values.push_back(start);
        return values;
    }
    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(static_cast<double>(i) * step + start);
    }
    values.back() = stop;
    return values;
}

NormalizedTimeAxis normalize_time_axis(const std::vector<TimePoint>& timestamps) {
    NormalizedTimeAxis axis;

    if (timestamps.size() < 2) {
        axis.error = FitError::DegenerateInput;
        axis.message = "At least 2 samples are required, got " + std::to_string(timestamps.size()) + ".";
        return axis;
    }

    axis.origin = timestamps.front();
    axis.offsets.reserve(timestamps.size());
    for (size_t i = 0; i < timestamps.size(); ++i) {
        if (i > 0 && timestamps[i] <= timestamps[i - 1]) {
            axis.error = FitError::DegenerateInput;
            axis.message = (timestamps[i] == timestamps.front())
                ? "All timestamps up to sample " + std::to_string(i) + " are identical."
                : "Timestamps are not strictly increasing at sample " + std::to_string(i) + ".";
            axis.offsets.clear();
            return axis;
        }
        axis.offsets.push_back(offset_in_days(axis.origin, timestamps[i]));
    }

    const auto range = std::minmax_element(axis.offsets.begin(), axis.offsets.end());
    if (!(*range.second > *range.first)) {
        // Sub-resolution spacing can still collapse to a zero-width axis.
        axis.error = FitError::DegenerateInput;
        axis.message = "Time axis has zero width.";
        axis.offsets.clear();
        return axis;
    }

    axis.evaluation_offsets = linspace(*range.first, *range.second, kEvaluationPointCount);
    axis.evaluation_axis.reserve(kEvaluationPointCount);
    for (double offset : axis.evaluation_offsets) {
        axis.evaluation_axis.push_back(denormalize_offset(axis.origin, offset));
    }

    axis.success = true;
    axis.message = "Time axis normalized.";
    return axis;
}
