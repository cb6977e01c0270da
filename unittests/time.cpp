#include "test.hpp"

#include "time.hpp"

TEST_CASE("Duration::parse")
{
    TEST_CHECK(Duration::parse("30d") == Duration::fromDays(30));
    TEST_CHECK(Duration::parse("2s") == Duration::fromSeconds(2));
    TEST_CHECK(Duration::parse("90m")->toSeconds() == 90 * 60);
    TEST_CHECK(toString(*Duration::parse("36h")) == "1d12h0m0s");
}

TEST_CASE("Duration::parse fails")
{
    TEST_CHECK(!Duration::parse(""));
    TEST_CHECK(!Duration::parse("d"));
    TEST_CHECK(!Duration::parse("12"));
    TEST_CHECK(!Duration::parse("12w"));
    TEST_CHECK(!Duration::parse("-1d"));
    TEST_CHECK(!Duration::parse("1.5h"));
}

TEST_CASE("Duration ordering")
{
    TEST_CHECK(Duration::fromHours(23) < Duration::fromDays(1));
    TEST_CHECK(!(Duration::fromDays(1) < Duration::fromHours(24)));
    TEST_CHECK(Duration::fromSeconds(2).toMilliseconds() == 2000);
}
