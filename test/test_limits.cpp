#include <catch2/catch_test_macros.hpp>
#include <yv/limits.h>
#include <limits>

using namespace yv;

TEST_CASE("Inclusive limits accept their boundary", "[limits]") {
    auto lower = Limit<std::int64_t>::inclusive(10);
    REQUIRE_FALSE(lower.is_lesser(10));
    REQUIRE(lower.is_lesser(9));
    REQUIRE_FALSE(lower.is_lesser(11));

    auto upper = Limit<std::int64_t>::inclusive(10);
    REQUIRE_FALSE(upper.is_greater(10));
    REQUIRE(upper.is_greater(11));
}

TEST_CASE("Exclusive limits reject their boundary", "[limits]") {
    auto lower = Limit<double>::exclusive(0.0);
    REQUIRE(lower.is_lesser(0.0));
    REQUIRE(lower.is_lesser(-0.5));
    REQUIRE_FALSE(lower.is_lesser(0.0001));

    auto upper = Limit<double>::exclusive(1.0);
    REQUIRE(upper.is_greater(1.0));
    REQUIRE_FALSE(upper.is_greater(0.999));
    REQUIRE(upper.isExclusive());
}

TEST_CASE("has_span with open ranges", "[limits][span]") {
    std::optional<Limit<std::int64_t>> none;
    REQUIRE(has_span<std::int64_t>(none, none, 1));
    REQUIRE(has_span<std::int64_t>(Limit<std::int64_t>::exclusive(10), none, 1));
    REQUIRE(has_span<std::int64_t>(none, Limit<std::int64_t>::inclusive(-5), 1));
}

TEST_CASE("has_span with inclusive bounds", "[limits][span]") {
    using L = Limit<std::int64_t>;
    REQUIRE(has_span<std::int64_t>(L::inclusive(10), L::inclusive(10), 1));
    REQUIRE_FALSE(has_span<std::int64_t>(L::inclusive(11), L::inclusive(10), 1));
    REQUIRE_FALSE(has_span<std::int64_t>(L::exclusive(10), L::inclusive(9), 1));
}

TEST_CASE("has_span with two exclusive bounds needs room for a value", "[limits][span]") {
    using I = Limit<std::int64_t>;
    REQUIRE_FALSE(has_span<std::int64_t>(I::exclusive(10), I::exclusive(10), 1));
    REQUIRE_FALSE(has_span<std::int64_t>(I::exclusive(10), I::exclusive(11), 1));
    REQUIRE(has_span<std::int64_t>(I::exclusive(10), I::exclusive(12), 1));

    using R = Limit<double>;
    double unit = std::numeric_limits<double>::min();
    REQUIRE_FALSE(has_span<double>(R::exclusive(10.0), R::exclusive(10.0), unit));
    REQUIRE(has_span<double>(R::exclusive(10.0), R::exclusive(11.0), unit));
}

TEST_CASE("has_span does not overflow on extreme integers", "[limits][span]") {
    using I = Limit<std::int64_t>;
    auto lo = std::numeric_limits<std::int64_t>::min();
    auto hi = std::numeric_limits<std::int64_t>::max();
    REQUIRE(has_span<std::int64_t>(I::exclusive(lo), I::exclusive(hi), 1));
}
