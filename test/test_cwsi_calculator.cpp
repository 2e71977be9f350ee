#include <catch2/catch.hpp>
#include <field_alert/engine/cwsi_calculator.hpp>
#include <limits>

namespace {
    CwsiBaseline cornBaseline() {
        CwsiBaseline b{};
        REQUIRE(CwsiCalculator::baselineForCrop(CropType::CORN, b));
        return b;
    }

    // Canopy temperature giving the requested dT over 30 C air
    float canopyFor(float delta_t_c) {
        return 30.0f + delta_t_c;
    }
}

TEST_CASE("CWSI spans the two baselines", "[cwsi]") {
    CwsiCalculator calc(cornBaseline(), false);
    REQUIRE(calc.isConfigured());
    CwsiState state{};

    // At 2 kPa: lower = 2.67 - 4.08 = -1.41, upper = 4.5
    REQUIRE(calc.compute(canopyFor(-1.41f), 30.0f, 2.0f, state) == EngineError::NONE);
    CHECK(state.valid);
    CHECK(state.index == Approx(0.0f).margin(1e-4));

    REQUIRE(calc.compute(canopyFor(4.5f), 30.0f, 2.0f, state) == EngineError::NONE);
    CHECK(state.index == Approx(1.0f).margin(1e-4));

    REQUIRE(calc.compute(canopyFor(1.545f), 30.0f, 2.0f, state) == EngineError::NONE);
    CHECK(state.index == Approx(0.5f).margin(1e-3));
    CHECK(state.delta_t_c == Approx(1.545f).margin(1e-3));
    CHECK(state.vpd_kpa == Approx(2.0f));
}

TEST_CASE("CWSI is clamped to [0, 1]", "[cwsi]") {
    CwsiCalculator calc(cornBaseline(), false);
    CwsiState state{};

    REQUIRE(calc.compute(canopyFor(-8.0f), 30.0f, 1.0f, state) == EngineError::NONE);
    CHECK(state.index == 0.0f);

    REQUIRE(calc.compute(canopyFor(12.0f), 30.0f, 1.0f, state) == EngineError::NONE);
    CHECK(state.index == 1.0f);
}

TEST_CASE("compute does not change the calculator", "[cwsi]") {
    CwsiCalculator calc(cornBaseline(), false);
    CwsiState state{};
    REQUIRE(calc.compute(canopyFor(3.0f), 30.0f, 2.0f, state) == EngineError::NONE);
    CHECK_FALSE(calc.state().valid);

    calc.accept(state, 0.5f);
    CHECK(calc.state().valid);
    CHECK(calc.state().index == Approx(state.index));
}

TEST_CASE("Degenerate or missing baselines are reported", "[cwsi]") {
    CwsiState state{};

    CwsiCalculator unconfigured;
    CHECK(unconfigured.compute(28.0f, 30.0f, 2.0f, state) == EngineError::CONFIG);

    CwsiBaseline flat{ 1.0f, 0.0f, 1.0f, 0.0f };
    CwsiCalculator coincident(flat, false);
    CHECK(coincident.compute(28.0f, 30.0f, 2.0f, state) == EngineError::COMPUTATION);

    // Lower line crosses above the upper one at high VPD
    CwsiBaseline crossing{ 0.0f, 1.0f, 2.0f, 0.0f };
    CwsiCalculator crossed(crossing, false);
    CHECK(crossed.compute(28.0f, 30.0f, 1.0f, state) == EngineError::NONE);
    CHECK(crossed.compute(28.0f, 30.0f, 3.0f, state) == EngineError::COMPUTATION);

    CwsiCalculator corn(cornBaseline(), false);
    CHECK(corn.compute(28.0f, 30.0f, std::numeric_limits<float>::quiet_NaN(), state) == EngineError::COMPUTATION);
}

TEST_CASE("Every configured crop has a baseline", "[cwsi]") {
    CwsiBaseline b{};
    CHECK(CwsiCalculator::baselineForCrop(CropType::CORN, b));
    CHECK(CwsiCalculator::baselineForCrop(CropType::COTTON, b));
    CHECK(CwsiCalculator::baselineForCrop(CropType::SOYBEAN, b));
    CHECK(CwsiCalculator::baselineForCrop(CropType::SORGHUM, b));
    CHECK(b.lower_slope_c_per_kpa < 0.0f);
}

TEST_CASE("Lower baseline is refitted from well-watered samples", "[cwsi]") {
    CwsiCalculator calc(cornBaseline(), true);
    CwsiState state{};

    // Stressed samples are ignored, and so are readings of unknown soil state
    REQUIRE(calc.compute(canopyFor(1.0f), 30.0f, 1.0f, state) == EngineError::NONE);
    calc.accept(state, 0.6f);
    CHECK(calc.fitSampleCount() == 0);
    calc.accept(state, 0.0f, false);
    CHECK(calc.fitSampleCount() == 0);
    CHECK(calc.state().valid);

    // dT = 1 - 1.5 * VPD over 0.5 .. 3.25 kPa
    for (int i = 0; i < 12; ++i) {
        const float vpd = 0.5f + 0.25f * static_cast<float>(i);
        REQUIRE(calc.compute(canopyFor(1.0f - 1.5f * vpd), 30.0f, vpd, state) == EngineError::NONE);
        calc.accept(state, 0.05f);
        if (i < 11) {
            CHECK_FALSE(calc.state().fitted);
        }
    }
    CHECK(calc.fitSampleCount() == 12);
    REQUIRE(calc.state().fitted);
    CHECK(calc.state().baseline.lower_slope_c_per_kpa == Approx(-1.5f).margin(1e-3));
    CHECK(calc.state().baseline.lower_intercept_c == Approx(1.0f).margin(1e-3));
    CHECK(calc.state().baseline.upper_intercept_c == Approx(4.5f));

    calc.reset();
    CHECK_FALSE(calc.state().fitted);
    CHECK(calc.fitSampleCount() == 0);
    CHECK(calc.state().baseline.lower_slope_c_per_kpa == Approx(-2.04f));
}

TEST_CASE("Refit needs a VPD spread and a falling line", "[cwsi]") {
    CwsiState state{};

    SECTION("narrow VPD range") {
        CwsiCalculator calc(cornBaseline(), true);
        for (int i = 0; i < 20; ++i) {
            const float vpd = 2.0f + 0.02f * static_cast<float>(i);
            REQUIRE(calc.compute(canopyFor(1.0f - 1.5f * vpd), 30.0f, vpd, state) == EngineError::NONE);
            calc.accept(state, 0.0f);
        }
        CHECK_FALSE(calc.state().fitted);
    }

    SECTION("rising line") {
        CwsiCalculator calc(cornBaseline(), true);
        for (int i = 0; i < 20; ++i) {
            const float vpd = 0.5f + 0.2f * static_cast<float>(i);
            REQUIRE(calc.compute(canopyFor(-3.0f + 0.5f * vpd), 30.0f, vpd, state) == EngineError::NONE);
            calc.accept(state, 0.0f);
        }
        CHECK_FALSE(calc.state().fitted);
    }

    SECTION("fitting disabled") {
        CwsiCalculator calc(cornBaseline(), false);
        for (int i = 0; i < 20; ++i) {
            const float vpd = 0.5f + 0.2f * static_cast<float>(i);
            REQUIRE(calc.compute(canopyFor(1.0f - 1.5f * vpd), 30.0f, vpd, state) == EngineError::NONE);
            calc.accept(state, 0.0f);
        }
        CHECK(calc.fitSampleCount() == 0);
        CHECK_FALSE(calc.state().fitted);
    }
}

TEST_CASE("A refit that meets the upper baseline is refused", "[cwsi]") {
    CwsiCalculator calc(cornBaseline(), true);
    CwsiState state{};

    // dT = 5.5 - 2 * VPD over 1 .. 3 kPa sits above the 4.5 C upper limit below 0.5 kPa
    for (int i = 0; i <= 12; ++i) {
        const float vpd = 1.0f + static_cast<float>(i) / 6.0f;
        REQUIRE(calc.compute(canopyFor(5.5f - 2.0f * vpd), 30.0f, vpd, state) == EngineError::NONE);
        calc.accept(state, 0.05f);
    }
    CHECK(calc.fitSampleCount() == 13);
    CHECK_FALSE(calc.state().fitted);
    CHECK(calc.state().baseline.lower_intercept_c == Approx(2.67f));
    CHECK(calc.state().baseline.lower_slope_c_per_kpa == Approx(-2.04f));

    // Humid night-time readings still resolve
    CHECK(calc.compute(canopyFor(-0.5f), 30.0f, 0.3f, state) == EngineError::NONE);
    CHECK(calc.compute(canopyFor(-0.5f), 30.0f, 0.0f, state) == EngineError::NONE);
}
