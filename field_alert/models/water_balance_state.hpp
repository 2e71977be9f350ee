#ifndef FIELD_ALERT_WATER_BALANCE_STATE_HPP
#define FIELD_ALERT_WATER_BALANCE_STATE_HPP

#include <cstdint>

// Running soil water balance of one zone (lumped bucket, mm of water)
struct WaterBalanceState {
    float    smd_mm;               // deficit below field capacity, 0..whc_mm
    float    whc_mm;               // effective water holding capacity of the root zone
    float    cumulative_et_mm;     // since last irrigation
    float    cumulative_rain_mm;   // since last irrigation
    uint32_t last_update_ts_s;     // time the balance is projected to (observation or irrigation)
    bool     has_observation;
    uint32_t last_observation_ts_s; // valid only when has_observation
    bool     superseded;           // last observation predates the latest irrigation and was not applied
    bool     has_irrigation;
    uint32_t last_irrigation_ts_s; // valid only when has_irrigation
    bool     reconciled;           // last update was corrected by sensor readings
    float    measured_smd_mm;      // deficit seen by the sensors when reconciled

    float smdFraction() const {
        return (whc_mm > 0.0f) ? (smd_mm / whc_mm) : 0.0f;
    }
};

#endif // FIELD_ALERT_WATER_BALANCE_STATE_HPP
