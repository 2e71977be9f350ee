#ifndef FIELD_ALERT_WATER_BALANCE_TRACKER_HPP
#define FIELD_ALERT_WATER_BALANCE_TRACKER_HPP

#include <cstdint>
#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/engine/et_estimator.hpp>
#include <field_alert/models/observation.hpp>
#include <field_alert/models/water_balance_state.hpp>
#include <field_alert/models/engine_error.hpp>

// Lumped-bucket soil moisture deficit of one zone.
//
// Between sensor readings the deficit is projected forward with
//   SMD_new = SMD_old + ET(dt) - rain
// and, when depth readings are present, pulled towards the deficit the
// sensors report (sensor_trust = 1 adopts the sensed value outright).
// The result is clamped to [0, WHC]. The stored state is only replaced
// after a complete, successful update.
class WaterBalanceTracker {
public:
    WaterBalanceTracker();
    WaterBalanceTracker(const SoilProfile* profile, EtEstimator* et_estimator, float sensor_trust);

    // First observation anchors the zone at field capacity (SMD = 0).
    // Observations must arrive in time order among themselves; one taken
    // before the latest logged irrigation is accepted but leaves the
    // refilled bucket as it is.
    EngineError update(const Observation& obs, WaterBalanceState& out_state);

    // Irrigation brings the zone back to field capacity
    EngineError recordIrrigation(uint32_t ts_s, WaterBalanceState& out_state);

    bool hasState() const;
    const WaterBalanceState& state() const;
    void reset();

private:
    WaterBalanceState initialState(uint32_t ts_s) const;

    const SoilProfile* profile;
    EtEstimator* et_estimator;
    float sensor_trust;
    WaterBalanceState current;
    bool initialized;
};

#endif // FIELD_ALERT_WATER_BALANCE_TRACKER_HPP
