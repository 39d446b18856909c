#include <doctest/doctest.h>
#include "aqlink/backoff.hpp"

#include <stdexcept>

using namespace aqlink;

TEST_CASE("Without jitter the delay doubles up to the cap") {
    ExponentialBackoff b(Seconds(1.0), Seconds(10.0), 0.0);
    CHECK(b.next_delay(false).count() == doctest::Approx(2.0));
    CHECK(b.next_delay(false).count() == doctest::Approx(4.0));
    CHECK(b.next_delay(false).count() == doctest::Approx(8.0));
    CHECK(b.next_delay(false).count() == doctest::Approx(10.0));
    CHECK(b.next_delay(false).count() == doctest::Approx(10.0));
}

TEST_CASE("Success resets to base and returns zero") {
    ExponentialBackoff b(Seconds(0.5), Seconds(60.0), 0.0);
    b.next_delay(false);
    b.next_delay(false);
    CHECK(b.current().count() == doctest::Approx(2.0));

    CHECK(b.next_delay(true).count() == 0.0);
    CHECK(b.current().count() == doctest::Approx(0.5));
    CHECK(b.next_delay(false).count() == doctest::Approx(1.0));
}

TEST_CASE("Jitter stays within the configured fraction") {
    ExponentialBackoff b(Seconds(1.0), Seconds(60.0), 0.5, 42);
    for (int i = 0; i < 10; ++i) {
        const double d = b.next_delay(false).count();
        const double base = b.current().count();
        CHECK(d >= base * 0.5);
        CHECK(d <= base * 1.5);
    }
    CHECK(b.current().count() == doctest::Approx(60.0));
}

TEST_CASE("Same seed, same sequence") {
    ExponentialBackoff a(Seconds(1.0), Seconds(60.0), 0.5, 7);
    ExponentialBackoff c(Seconds(1.0), Seconds(60.0), 0.5, 7);
    for (int i = 0; i < 5; ++i) {
        CHECK(a.next_delay(false).count() == c.next_delay(false).count());
    }
}

TEST_CASE("Defaults are 1 s base, 60 s cap and half jitter") {
    ExponentialBackoff b;
    CHECK(b.base().count() == doctest::Approx(1.0));
    CHECK(b.max().count() == doctest::Approx(60.0));
    CHECK(b.jitter() == doctest::Approx(0.5));
    const double first = b.next_delay(false).count();
    CHECK(first >= 1.0);
    CHECK(first <= 3.0);
}

TEST_CASE("Nonsense bounds are rejected") {
    CHECK_THROWS_AS(ExponentialBackoff(Seconds(0.0)), std::invalid_argument);
    CHECK_THROWS_AS(ExponentialBackoff(Seconds(5.0), Seconds(1.0)), std::invalid_argument);
    CHECK_THROWS_AS(ExponentialBackoff(Seconds(1.0), Seconds(2.0), 1.5), std::invalid_argument);
    CHECK_THROWS_AS(ExponentialBackoff(Seconds(1.0), Seconds(2.0), -0.1), std::invalid_argument);
}
