#include <doctest/doctest.h>
#include "ambience/fade_envelope.hh"

using namespace ambience;
using namespace std::chrono_literals;

TEST_SUITE("FadeEnvelope") {
    using fade_clock = fade_envelope::clock;

    TEST_CASE("idle envelope") {
        fade_envelope env;
        CHECK(env.get_state() == fade_envelope::state::none);
        CHECK(env.gain() == doctest::Approx(1.f));
        CHECK(env.is_complete());

        env.reset(0.f);
        CHECK(env.gain() == doctest::Approx(0.f));
    }

    TEST_CASE("cubic fade in") {
        const auto t0 = fade_clock::now();
        fade_envelope env;
        env.reset(0.f);
        env.start_fade_in(100ms, t0);

        CHECK(env.get_state() == fade_envelope::state::fade_in);
        CHECK(env.gain(t0) == doctest::Approx(0.f));
        CHECK(env.gain(t0 + 50ms) == doctest::Approx(0.125f));
        CHECK_FALSE(env.is_complete(t0 + 99ms));
        CHECK(env.is_complete(t0 + 100ms));
        CHECK(env.gain(t0 + 200ms) == doctest::Approx(1.f));
    }

    TEST_CASE("cubic fade out") {
        const auto t0 = fade_clock::now();
        fade_envelope env;
        env.start_fade_out(100ms, t0);

        CHECK(env.get_state() == fade_envelope::state::fade_out);
        CHECK(env.gain(t0) == doctest::Approx(1.f));
        CHECK(env.gain(t0 + 50ms) == doctest::Approx(0.125f));
        CHECK(env.gain(t0 + 100ms) == doctest::Approx(0.f));
    }

    TEST_CASE("reversing a fade starts from the current gain") {
        const auto t0 = fade_clock::now();
        fade_envelope env;
        env.start_fade_out(100ms, t0);
        const float mid = env.gain(t0 + 50ms);

        env.start_fade_in(100ms, t0 + 50ms);
        CHECK(env.gain(t0 + 50ms) == doctest::Approx(mid));
        CHECK(env.gain(t0 + 150ms) == doctest::Approx(1.f));
    }

    TEST_CASE("zero duration completes at once") {
        const auto t0 = fade_clock::now();
        fade_envelope env;
        env.reset(0.f);
        env.start_fade_in(0ms, t0);
        CHECK(env.is_complete(t0));
        CHECK(env.gain(t0) == doctest::Approx(1.f));

        env.start_fade_out(0ms, t0);
        CHECK(env.gain(t0) == doctest::Approx(0.f));
    }

    TEST_CASE("gain stays in range") {
        const auto t0 = fade_clock::now();
        fade_envelope env;
        env.reset(0.f);
        env.start_fade_in(30ms, t0);
        for (int ms = 0; ms <= 40; ++ms) {
            const float g = env.gain(t0 + std::chrono::milliseconds(ms));
            CHECK(g >= 0.f);
            CHECK(g <= 1.f);
        }
    }
}
