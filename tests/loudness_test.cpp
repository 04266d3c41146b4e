#include "common.hpp"

#include "loudness/loudness.hpp"

#include <cmath>
#include <limits>

using namespace Loudness;

int main(const int argc, char *argv[]) {
    Setup();
    const int ret = Catch::Session().run(argc, argv);
    return ret;
}

TEST_CASE("Measure") {
    SECTION("Full scale 997 Hz sine on one channel is -3.01 LUFS") {
        const auto pcm = MakeSine(48000, 1, 5.0, 997.0, 1.0);
        REQUIRE(Measure(pcm) == Catch::Approx(-3.01).margin(0.1));
    }

    SECTION("Identical stereo channels add 3 dB") {
        const auto mono = MakeSine(48000, 1, 5.0, 997.0, 0.5);
        const auto stereo = MakeSine(48000, 2, 5.0, 997.0, 0.5);
        REQUIRE(Measure(stereo) - Measure(mono) == Catch::Approx(3.01).margin(0.05));
    }

    SECTION("Works at 44.1 kHz") {
        const auto pcm = MakeSine(44100, 1, 5.0, 997.0, 1.0);
        REQUIRE(Measure(pcm) == Catch::Approx(-3.01).margin(0.1));
    }

    SECTION("EBU Tech 3341 stereo 1 kHz tones") {
        const auto at23 = MakeSine(48000, 2, 20.0, 1000.0, std::pow(10.0, -23.0 / 20.0));
        REQUIRE(Measure(at23) == Catch::Approx(-23.0).margin(0.1));

        const auto at33 = MakeSine(48000, 2, 20.0, 1000.0, std::pow(10.0, -33.0 / 20.0));
        REQUIRE(Measure(at33) == Catch::Approx(-33.0).margin(0.1));
    }

    SECTION("Surrounds of a 5.0 layout weigh 1.41") {
        auto front = MakeSine(48000, 5, 3.0, 997.0, 0.0);
        auto surround = front;
        const auto tone = MakeSine(48000, 1, 3.0, 997.0, 0.3).Channels[0];
        front.Channels[0] = tone;
        surround.Channels[4] = tone;
        REQUIRE(Measure(surround) - Measure(front) == Catch::Approx(10.0 * std::log10(1.41)).margin(0.05));
    }

    SECTION("Channels beyond 5.1 count at full weight") {
        auto first = MakeSine(48000, 8, 3.0, 997.0, 0.0);
        auto last = first;
        const auto tone = MakeSine(48000, 1, 3.0, 997.0, 0.3).Channels[0];
        first.Channels[0] = tone;
        last.Channels[7] = tone;
        REQUIRE(Measure(last) == Catch::Approx(Measure(first)).margin(1e-6));
    }

    SECTION("LFE of a 5.1 layout is ignored") {
        auto pcm = MakeSine(48000, 6, 2.0, 60.0, 0.0);
        pcm.Channels[3] = MakeSine(48000, 1, 2.0, 60.0, 0.8).Channels[0];
        REQUIRE(std::isinf(Measure(pcm)));
    }

    SECTION("Silence is not measurable") {
        const auto pcm = MakeSine(48000, 2, 2.0, 997.0, 0.0);
        REQUIRE(std::isinf(Measure(pcm)));
    }

    SECTION("Shorter than one block is not measurable") {
        const auto pcm = MakeSine(48000, 1, 0.3, 997.0, 0.5);
        REQUIRE(std::isinf(Measure(pcm)));
    }
}

TEST_CASE("ComputeGain") {
    for (const double target : {-70.0, -23.0, -16.0, -0.5, 0.0}) {
        for (const double measured : {-60.0, -31.2, -16.0, -3.0}) {
            REQUIRE(std::abs(ComputeGain(target, measured) - (target - measured)) < 1e-6);
        }
    }
}

TEST_CASE("ApplyGain") {
    auto pcm = MakeSine(48000, 1, 1.0, 997.0, 0.9);

    SECTION("+6.02 dB doubles the amplitude without clamping") {
        const float before = pcm.Channels[0][12];
        ApplyGain(pcm, 20.0 * std::log10(2.0));
        REQUIRE(pcm.Channels[0][12] == Catch::Approx(before * 2.0f).epsilon(1e-5));

        float peak = 0.0f;
        for (const float s : pcm.Channels[0]) {
            peak = std::max(peak, std::abs(s));
        }
        REQUIRE(peak > 1.0f);
    }

    SECTION("0 dB is a no-op") {
        const auto before = pcm.Channels[0];
        ApplyGain(pcm, 0.0);
        REQUIRE(pcm.Channels[0] == before);
    }
}

TEST_CASE("Normalize") {
    SECTION("-23 LUFS to -16 LUFS gains 7 dB") {
        auto pcm = MakeSine(48000, 2, 3.0, 997.0, 0.25);
        ApplyGain(pcm, ComputeGain(-23.0, Measure(pcm)));
        REQUIRE(Measure(pcm) == Catch::Approx(-23.0).margin(1e-3));

        const auto result = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Normalized>(result));
        const auto &n = std::get<Normalized>(result);
        REQUIRE(n.Original == Catch::Approx(-23.0).margin(1e-3));
        REQUIRE(n.Target == -16.0);
        REQUIRE(n.Gain == Catch::Approx(7.0).margin(1e-3));
        REQUIRE(std::abs(Measure(pcm) + 16.0) < 0.5);
    }

    SECTION("Normalizing twice barely changes anything") {
        auto pcm = MakeSine(44100, 1, 4.0, 440.0, 0.05);
        REQUIRE(std::holds_alternative<Normalized>(Normalize(pcm, -16.0)));

        const auto again = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Normalized>(again));
        REQUIRE(std::abs(std::get<Normalized>(again).Gain) < 0.5);
    }

    SECTION("Quiet input gets more than the extreme gain and is still scaled") {
        auto pcm = MakeSine(48000, 1, 2.0, 997.0, 0.001);
        const auto result = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Normalized>(result));
        REQUIRE(std::get<Normalized>(result).Gain > EXTREME_GAIN);
        REQUIRE(std::abs(Measure(pcm) + 16.0) < 0.5);
    }

    SECTION("0.2 s is too short and left untouched") {
        auto pcm = MakeSine(48000, 2, 0.2, 997.0, 0.5);
        const auto before = pcm.Channels;
        const auto result = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Skip>(result));
        REQUIRE(std::get<Skip>(result) == Skip::TooShort);
        REQUIRE(pcm.Channels == before);
    }

    SECTION("Silence is unmeasurable and left untouched") {
        auto pcm = MakeSine(48000, 2, 1.0, 997.0, 0.0);
        const auto result = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Skip>(result));
        REQUIRE(std::get<Skip>(result) == Skip::Unmeasurable);
    }

    SECTION("NaN samples are unmeasurable") {
        auto pcm = MakeSine(48000, 1, 1.0, 997.0, 0.5);
        pcm.Channels[0][100] = std::numeric_limits<float>::quiet_NaN();
        const auto result = Normalize(pcm, -16.0);
        REQUIRE(std::holds_alternative<Skip>(result));
        REQUIRE(std::get<Skip>(result) == Skip::Unmeasurable);
    }
}
