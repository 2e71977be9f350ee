#include <catch2/catch.hpp>
#include <field_alert/engine/soil_profile.hpp>
#include "fakes.hpp"

TEST_CASE("SoilProfile from texture uses the configured table", "[soil]") {
    SoilProfile profile;
    REQUIRE(SoilProfile::fromTexture(SoilTexture::SILT_LOAM, CropType::CORN, profile) == EngineError::NONE);
    REQUIRE(profile.isConfigured());
    CHECK(profile.config().depths[0].field_capacity == Approx(0.33f));
    CHECK(profile.config().depths[2].wilting_point == Approx(0.13f));
    // (0.33 - 0.13) * 36 in
    CHECK(profile.effectiveWhcMm() == Approx(0.20f * 914.4f).epsilon(1e-4));
    CHECK(profile.weightedMask() == ALL_DEPTHS_MASK);
}

TEST_CASE("SoilProfile rejects inconsistent settings", "[soil]") {
    SoilProfile profile;
    SoilProfile::Config cfg = TestData::uniformConfig();

    SECTION("field capacity not above wilting point") {
        cfg.depths[1].field_capacity = 0.125f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    SECTION("fraction outside [0, 1]") {
        cfg.depths[0].field_capacity = 1.2f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    SECTION("weights not summing to one") {
        cfg.weights[2] = 0.15f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    SECTION("negative weight") {
        cfg.weights[0] = 1.0f;
        cfg.weights[1] = 0.25f;
        cfg.weights[2] = -0.25f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    SECTION("no weight at all") {
        cfg.weights[0] = cfg.weights[1] = cfg.weights[2] = 0.0f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    SECTION("zero root depth") {
        cfg.root_zone_depth_mm = 0.0f;
        CHECK(SoilProfile::create(cfg, profile) == EngineError::CONFIG);
    }
    CHECK_FALSE(profile.isConfigured());
}

TEST_CASE("Effective WHC renormalizes over the depths present", "[soil]") {
    SoilProfile::Config cfg = TestData::uniformConfig();
    cfg.depths[1].wilting_point = 0.25f;   // 0.125 available
    cfg.depths[2].wilting_point = 0.25f;   // 0.125 available
    SoilProfile profile;
    REQUIRE(SoilProfile::create(cfg, profile) == EngineError::NONE);

    float whc = 0.0f;
    REQUIRE(profile.effectiveWhc(ALL_DEPTHS_MASK, whc) == EngineError::NONE);
    CHECK(whc == Approx(0.5f * 0.25f + 0.25f * 0.125f + 0.25f * 0.125f));
    CHECK(profile.effectiveWhcMm() == Approx(187.5f));

    REQUIRE(profile.effectiveWhc(0x6, whc) == EngineError::NONE);
    CHECK(whc == Approx(0.125f));

    REQUIRE(profile.effectiveWhc(0x1, whc) == EngineError::NONE);
    CHECK(whc == Approx(0.25f));

    CHECK(profile.effectiveWhc(0x0, whc) == EngineError::NO_DATA);
}

TEST_CASE("Depths without weight do not count as data", "[soil]") {
    SoilProfile::Config cfg = TestData::uniformConfig();
    cfg.weights[0] = 1.0f;
    cfg.weights[1] = 0.0f;
    cfg.weights[2] = 0.0f;
    SoilProfile profile;
    REQUIRE(SoilProfile::create(cfg, profile) == EngineError::NONE);
    CHECK(profile.weightedMask() == 0x1);

    float whc = 0.0f;
    CHECK(profile.effectiveWhc(0x6, whc) == EngineError::NO_DATA);
}

TEST_CASE("Measured deficit is weighted below field capacity", "[soil]") {
    SoilProfile profile = TestData::uniformProfile();
    const float vwc[SOIL_DEPTH_COUNT] = { 0.25f, 0.375f, 0.125f };
    float deficit = 0.0f;

    REQUIRE(profile.measuredDeficitMm(vwc, ALL_DEPTHS_MASK, deficit) == EngineError::NONE);
    // 0.5 * 0.125 + 0.25 * 0 + 0.25 * 0.25 over 1000 mm
    CHECK(deficit == Approx(125.0f));

    REQUIRE(profile.measuredDeficitMm(vwc, 0x3, deficit) == EngineError::NONE);
    CHECK(deficit == Approx((0.5f * 0.125f) / 0.75f * 1000.0f));

    SoilProfile unconfigured;
    CHECK(unconfigured.measuredDeficitMm(vwc, ALL_DEPTHS_MASK, deficit) == EngineError::CONFIG);
}
