#ifndef FIELD_ALERT_OBSERVATION_HPP
#define FIELD_ALERT_OBSERVATION_HPP

#include <cstddef>
#include <cstdint>
#include <field_alert/models/soil_types.hpp>

// Zone identifiers are fixed-size, null-terminated (max 15 characters)
static constexpr std::size_t ZONE_ID_LEN = 16;

// Record as handed over by a collaborator (parser, sensor bridge).
// Optional fields are tagged with explicit presence flags.
struct RawObservation {
    char     zone_id[ZONE_ID_LEN];
    uint32_t ts_s;                        // UTC seconds
    float    canopy_temp_c;
    float    air_temp_c;
    float    vwc[SOIL_DEPTH_COUNT];       // volumetric water content, 0..1
    bool     has_vwc[SOIL_DEPTH_COUNT];
    bool     has_rh;
    float    rh_pct;
    bool     has_vpd;
    float    vpd_kpa;
    bool     has_rain;
    float    rain_mm;                     // since the previous observation
};

// Validated observation in engine units
struct Observation {
    char     zone_id[ZONE_ID_LEN];
    uint32_t ts_s;
    float    canopy_temp_c;
    float    air_temp_c;
    float    vwc[SOIL_DEPTH_COUNT];
    uint8_t  depth_mask;                  // bit i set when vwc[i] is present
    bool     has_rh;
    float    rh_pct;
    bool     has_vpd;                     // measured, or derived from RH
    float    vpd_kpa;
    float    rain_mm;                     // 0 when not reported
};

#endif // FIELD_ALERT_OBSERVATION_HPP
