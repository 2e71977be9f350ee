#include <field_alert/engine/water_balance_tracker.hpp>
#include <field_alert/utils/logger.hpp>
#include <cmath>

namespace {
    static const char* TAG = "WATER_BAL";

    static float clampf(float v, float lo, float hi) {
        return (v < lo) ? lo : (v > hi ? hi : v);
    }
}

WaterBalanceTracker::WaterBalanceTracker()
    : profile(nullptr), et_estimator(nullptr), sensor_trust(1.0f), current{}, initialized(false) {}

WaterBalanceTracker::WaterBalanceTracker(const SoilProfile* profile_in, EtEstimator* et_estimator_in,
                                         float sensor_trust_in)
    : profile(profile_in), et_estimator(et_estimator_in),
      sensor_trust(clampf(sensor_trust_in, 0.0f, 1.0f)), current{}, initialized(false) {}

WaterBalanceState WaterBalanceTracker::initialState(uint32_t ts_s) const {
    WaterBalanceState s{};
    s.smd_mm = 0.0f;
    s.whc_mm = profile->effectiveWhcMm();
    s.last_update_ts_s = ts_s;
    return s;
}

EngineError WaterBalanceTracker::update(const Observation& obs, WaterBalanceState& out_state) {
    if (profile == nullptr || !profile->isConfigured() || et_estimator == nullptr) {
        return EngineError::CONFIG;
    }

    if (!initialized) {
        current = initialState(obs.ts_s);
        current.has_observation = true;
        current.last_observation_ts_s = obs.ts_s;
        initialized = true;
        LOG_DEBUG(TAG, "Zone %s: balance started at field capacity (WHC %.1f mm)", obs.zone_id, current.whc_mm);
        out_state = current;
        return EngineError::NONE;
    }

    if (current.has_observation && obs.ts_s <= current.last_observation_ts_s) {
        LOG_WARN(TAG, "Zone %s: non-increasing timestamp %lu (last %lu)", obs.zone_id,
                 static_cast<unsigned long>(obs.ts_s), static_cast<unsigned long>(current.last_observation_ts_s));
        return EngineError::TEMPORAL_ORDER;
    }

    // Taken before a logged irrigation: the refill already reset the bucket
    if (obs.ts_s <= current.last_update_ts_s) {
        WaterBalanceState next = current;
        next.has_observation = true;
        next.last_observation_ts_s = obs.ts_s;
        next.superseded = true;
        next.reconciled = false;
        next.measured_smd_mm = 0.0f;
        current = next;
        out_state = current;
        LOG_DEBUG(TAG, "Zone %s: observation at %lu predates irrigation at %lu, balance kept", obs.zone_id,
                  static_cast<unsigned long>(obs.ts_s), static_cast<unsigned long>(current.last_update_ts_s));
        return EngineError::NONE;
    }

    float et_rate_mm_per_h = 0.0f;
    if (!et_estimator->estimateEtRate(obs.zone_id, current.last_update_ts_s, obs.ts_s, et_rate_mm_per_h) ||
        !std::isfinite(et_rate_mm_per_h) || et_rate_mm_per_h < 0.0f) {
        LOG_WARN(TAG, "Zone %s: no usable ET estimate", obs.zone_id);
        return EngineError::COMPUTATION;
    }

    const float dt_h = static_cast<float>(obs.ts_s - current.last_update_ts_s) / 3600.0f;
    const float et_mm = et_rate_mm_per_h * dt_h;

    WaterBalanceState next = current;
    float smd = current.smd_mm + et_mm - obs.rain_mm;
    next.superseded = false;
    next.reconciled = false;
    next.measured_smd_mm = 0.0f;

    const uint8_t usable = obs.depth_mask & profile->weightedMask();
    if (usable != 0U) {
        float measured_mm = 0.0f;
        if (profile->measuredDeficitMm(obs.vwc, usable, measured_mm) == EngineError::NONE) {
            measured_mm = clampf(measured_mm, 0.0f, next.whc_mm);
            const float measured_delta = sensor_trust * (smd - measured_mm);
            smd -= measured_delta;
            next.reconciled = true;
            next.measured_smd_mm = measured_mm;
        }
    }

    // Bucket bound is the full-profile WHC; missing probes only reweight the measurement
    next.smd_mm = clampf(smd, 0.0f, next.whc_mm);
    next.cumulative_et_mm += et_mm;
    next.cumulative_rain_mm += obs.rain_mm;
    next.last_update_ts_s = obs.ts_s;
    next.has_observation = true;
    next.last_observation_ts_s = obs.ts_s;

    current = next;
    out_state = current;
    LOG_DEBUG(TAG, "Zone %s: SMD %.1f/%.1f mm (ET %.2f, rain %.1f%s)", obs.zone_id, current.smd_mm,
              current.whc_mm, et_mm, obs.rain_mm, current.reconciled ? ", sensor corrected" : "");
    return EngineError::NONE;
}

EngineError WaterBalanceTracker::recordIrrigation(uint32_t ts_s, WaterBalanceState& out_state) {
    if (profile == nullptr || !profile->isConfigured()) {
        return EngineError::CONFIG;
    }
    if (ts_s == 0) {
        return EngineError::VALIDATION;
    }

    WaterBalanceState next = initialized ? current : initialState(ts_s);
    next.smd_mm = 0.0f;
    next.cumulative_et_mm = 0.0f;
    next.cumulative_rain_mm = 0.0f;
    next.superseded = false;
    next.reconciled = false;
    next.measured_smd_mm = 0.0f;
    // A late manual log entry never moves the last irrigation backwards
    if (!next.has_irrigation || ts_s > next.last_irrigation_ts_s) {
        next.last_irrigation_ts_s = ts_s;
    }
    next.has_irrigation = true;
    if (ts_s > next.last_update_ts_s) {
        next.last_update_ts_s = ts_s;
    }

    current = next;
    initialized = true;
    out_state = current;
    return EngineError::NONE;
}

bool WaterBalanceTracker::hasState() const {
    return initialized;
}

const WaterBalanceState& WaterBalanceTracker::state() const {
    return current;
}

void WaterBalanceTracker::reset() {
    current = WaterBalanceState{};
    initialized = false;
}
