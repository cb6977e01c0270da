#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Duration {
    uint32_t days = 0;
    uint32_t hours = 0;
    uint32_t minutes = 0;
    uint32_t seconds = 0;

    constexpr uint32_t toSeconds() const
    {
        return seconds + 60 * (minutes + 60 * (hours + 24 * days));
    }

    constexpr uint64_t toMilliseconds() const { return uint64_t(toSeconds()) * 1000; }

    Duration normalized() const;

    // "<number><unit>" with unit one of d, h, m, s
    static std::optional<Duration> parse(std::string_view str);
    static Duration fromDays(uint32_t d);
    static Duration fromHours(uint32_t h);
    static Duration fromMinutes(uint32_t m);
    static Duration fromSeconds(uint32_t s);
};

std::string toString(const Duration& d);

bool operator<(const Duration& a, const Duration& b);
bool operator==(const Duration& a, const Duration& b);
