#include <catch2/catch.hpp>
#include <field_alert/engine/observation_ingest.hpp>
#include <cstring>
#include "fakes.hpp"

using TestData::HOUR;
using TestData::T0;

TEST_CASE("A well-formed record is normalized", "[ingest]") {
    RawObservation raw = TestData::withVwc(TestData::raw("A", T0), 0.30f, 0.31f, 0.32f);
    raw.has_rain = true;
    raw.rain_mm = 4.0f;

    Observation obs{};
    REQUIRE(ObservationIngest::normalize(raw, 0, obs) == EngineError::NONE);
    CHECK(std::strcmp(obs.zone_id, "A") == 0);
    CHECK(obs.ts_s == T0);
    CHECK(obs.depth_mask == ALL_DEPTHS_MASK);
    CHECK(obs.vwc[1] == Approx(0.31f));
    CHECK(obs.rain_mm == Approx(4.0f));
    CHECK_FALSE(obs.has_vpd);
}

TEST_CASE("Missing depths are left out of the mask", "[ingest]") {
    RawObservation raw = TestData::raw("A", T0);
    raw.has_vwc[2] = true;
    raw.vwc[2] = 0.2f;

    Observation obs{};
    REQUIRE(ObservationIngest::normalize(raw, 0, obs) == EngineError::NONE);
    CHECK(obs.depth_mask == 0x4);
    CHECK(obs.rain_mm == 0.0f);
}

TEST_CASE("Out-of-range values are rejected, not clamped", "[ingest]") {
    RawObservation raw = TestData::raw("A", T0);
    Observation obs{};

    SECTION("canopy temperature") {
        raw.canopy_temp_c = 75.0f;
    }
    SECTION("air temperature") {
        raw.air_temp_c = -20.0f;
    }
    SECTION("relative humidity") {
        raw.has_rh = true;
        raw.rh_pct = 101.0f;
    }
    SECTION("negative VPD") {
        raw.has_vpd = true;
        raw.vpd_kpa = -0.5f;
    }
    SECTION("negative rain") {
        raw.has_rain = true;
        raw.rain_mm = -1.0f;
    }
    SECTION("VWC well above one") {
        raw = TestData::withVwc(raw, 0.3f, 1.2f, 0.3f);
    }
    SECTION("no timestamp") {
        raw.ts_s = 0;
    }
    CHECK(ObservationIngest::normalize(raw, 0, obs) == EngineError::VALIDATION);
}

TEST_CASE("VWC rounding noise is clamped into [0, 1]", "[ingest]") {
    RawObservation raw = TestData::withVwc(TestData::raw("A", T0), -0.003f, 1.004f, 0.5f);
    Observation obs{};
    REQUIRE(ObservationIngest::normalize(raw, 0, obs) == EngineError::NONE);
    CHECK(obs.vwc[0] == 0.0f);
    CHECK(obs.vwc[1] == 1.0f);
}

TEST_CASE("Zone ids must be non-empty and terminated", "[ingest]") {
    RawObservation raw = TestData::raw("A", T0);
    Observation obs{};

    raw.zone_id[0] = '\0';
    CHECK(ObservationIngest::normalize(raw, 0, obs) == EngineError::VALIDATION);

    std::memset(raw.zone_id, 'z', ZONE_ID_LEN);
    CHECK(ObservationIngest::normalize(raw, 0, obs) == EngineError::VALIDATION);
}

TEST_CASE("Stale timestamps are a temporal order error", "[ingest]") {
    Observation obs{};
    RawObservation raw = TestData::raw("A", T0);
    CHECK(ObservationIngest::normalize(raw, T0, obs) == EngineError::TEMPORAL_ORDER);
    CHECK(ObservationIngest::normalize(raw, T0 + HOUR, obs) == EngineError::TEMPORAL_ORDER);

    // Malformed and stale reports the malformation
    raw.canopy_temp_c = 99.0f;
    CHECK(ObservationIngest::normalize(raw, T0 + HOUR, obs) == EngineError::VALIDATION);
}

TEST_CASE("VPD is derived from humidity when not reported", "[ingest]") {
    RawObservation raw = TestData::raw("A", T0);
    raw.air_temp_c = 25.0f;
    raw.has_rh = true;
    raw.rh_pct = 50.0f;

    Observation obs{};
    REQUIRE(ObservationIngest::normalize(raw, 0, obs) == EngineError::NONE);
    REQUIRE(obs.has_vpd);
    CHECK(obs.vpd_kpa == Approx(1.584f).epsilon(0.01));

    raw.has_vpd = true;
    raw.vpd_kpa = 2.5f;
    REQUIRE(ObservationIngest::normalize(raw, 0, obs) == EngineError::NONE);
    CHECK(obs.vpd_kpa == Approx(2.5f));
}

TEST_CASE("Saturated air has no vapour pressure deficit", "[ingest]") {
    CHECK(ObservationIngest::vpdFromHumidity(30.0f, 100.0f) == Approx(0.0f).margin(1e-6));
    CHECK(ObservationIngest::vpdFromHumidity(35.0f, 20.0f) > ObservationIngest::vpdFromHumidity(25.0f, 20.0f));
}
