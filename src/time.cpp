#include "time.hpp"

#include <tuple>

#include "string.hpp"

Duration Duration::normalized() const
{
    auto totalSeconds = toSeconds();
    const auto d = totalSeconds / (24 * 60 * 60);
    totalSeconds -= d * 24 * 60 * 60;
    const auto h = totalSeconds / (60 * 60);
    totalSeconds -= h * 60 * 60;
    const auto m = totalSeconds / 60;
    totalSeconds -= m * 60;
    return Duration { d, h, m, totalSeconds };
}

std::optional<Duration> Duration::parse(std::string_view str)
{
    if (str.size() < 2) {
        return std::nullopt;
    }

    const auto numVal = parseInt<uint32_t>(str.substr(0, str.size() - 1));
    if (!numVal) {
        return std::nullopt;
    }

    switch (str.back()) {
    case 'd':
        return Duration::fromDays(*numVal);
    case 'h':
        return Duration::fromHours(*numVal);
    case 'm':
        return Duration::fromMinutes(*numVal);
    case 's':
        return Duration::fromSeconds(*numVal);
    default:
        return std::nullopt;
    }
}

Duration Duration::fromDays(uint32_t v)
{
    return Duration { v, 0, 0, 0 };
}

Duration Duration::fromHours(uint32_t v)
{
    return Duration { 0, v, 0, 0 }.normalized();
}

Duration Duration::fromMinutes(uint32_t v)
{
    return Duration { 0, 0, v, 0 }.normalized();
}

Duration Duration::fromSeconds(uint32_t v)
{
    return Duration { 0, 0, 0, v }.normalized();
}

std::string toString(const Duration& d)
{
    return std::to_string(d.days) + "d" + std::to_string(d.hours) + "h" + std::to_string(d.minutes)
        + "m" + std::to_string(d.seconds) + "s";
}

bool operator<(const Duration& a, const Duration& b)
{
    const auto na = a.normalized();
    const auto nb = b.normalized();
    return std::make_tuple(na.days, na.hours, na.minutes, na.seconds)
        < std::make_tuple(nb.days, nb.hours, nb.minutes, nb.seconds);
}

bool operator==(const Duration& a, const Duration& b)
{
    return a.toSeconds() == b.toSeconds();
}
