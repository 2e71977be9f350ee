#ifndef FIELD_ALERT_OBSERVATION_INGEST_HPP
#define FIELD_ALERT_OBSERVATION_INGEST_HPP

#include <cstdint>
#include <field_alert/models/observation.hpp>
#include <field_alert/models/engine_error.hpp>

// Validation of raw records into engine observations. Stateless: the caller
// supplies the zone's last accepted timestamp and owns whatever it updates.
namespace ObservationIngest {
    struct Limits {
        float min_temp_c;
        float max_temp_c;
        float vwc_rounding_tolerance;
        float max_vpd_kpa;
        float max_rain_mm;
    };

    // Limits from Config::Ingest
    Limits defaultLimits();

    // True when zone_id is non-empty and terminated within ZONE_ID_LEN
    bool isValidZoneId(const char* zone_id);

    // last_accepted_ts_s == 0 means the zone has accepted nothing yet.
    // Out-of-range values fail with VALIDATION (never clamped, apart from
    // VWC rounding noise); ts_s <= last_accepted_ts_s fails with TEMPORAL_ORDER.
    EngineError normalize(const RawObservation& raw, uint32_t last_accepted_ts_s,
                          const Limits& limits, Observation& out_obs);
    EngineError normalize(const RawObservation& raw, uint32_t last_accepted_ts_s,
                          Observation& out_obs);

    // Vapour pressure deficit (kPa) from air temperature and relative humidity
    float vpdFromHumidity(float air_temp_c, float rh_pct);
}

#endif // FIELD_ALERT_OBSERVATION_INGEST_HPP
