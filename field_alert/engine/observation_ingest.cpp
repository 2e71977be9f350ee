#include <field_alert/engine/observation_ingest.hpp>
#include <field_alert/config/config.hpp>
#include <field_alert/utils/logger.hpp>
#include <cmath>
#include <cstring>

namespace {
    static const char* TAG = "INGEST";

    static bool inRange(float v, float lo, float hi) {
        return std::isfinite(v) && v >= lo && v <= hi;
    }

    // Accepts [0, 1] plus rounding noise, which is clamped away
    static bool normalizeVwc(float raw, float tolerance, float& out) {
        if (!std::isfinite(raw) || raw < -tolerance || raw > 1.0f + tolerance) {
            return false;
        }
        out = (raw < 0.0f) ? 0.0f : (raw > 1.0f ? 1.0f : raw);
        return true;
    }
}

namespace ObservationIngest {
    Limits defaultLimits() {
        using namespace Config::Ingest;
        Limits limits{};
        limits.min_temp_c = min_temp_c;
        limits.max_temp_c = max_temp_c;
        limits.vwc_rounding_tolerance = vwc_rounding_tolerance;
        limits.max_vpd_kpa = max_vpd_kpa;
        limits.max_rain_mm = max_rain_mm;
        return limits;
    }

    bool isValidZoneId(const char* zone_id) {
        if (zone_id == nullptr || zone_id[0] == '\0') {
            return false;
        }
        return std::memchr(zone_id, '\0', ZONE_ID_LEN) != nullptr;
    }

    float vpdFromHumidity(float air_temp_c, float rh_pct) {
        // Saturation vapour pressure (Tetens / Monteith & Unsworth), kPa
        const float svp_kpa = 0.61078f * std::exp((17.2694f * air_temp_c) / (air_temp_c + 237.3f));
        return svp_kpa * (1.0f - rh_pct / 100.0f);
    }

    EngineError normalize(const RawObservation& raw, uint32_t last_accepted_ts_s,
                          const Limits& limits, Observation& out_obs) {
        if (!isValidZoneId(raw.zone_id)) {
            LOG_WARN(TAG, "%s", "Rejected record: missing or unterminated zone id");
            return EngineError::VALIDATION;
        }
        if (raw.ts_s == 0) {
            LOG_WARN(TAG, "Zone %s: rejected record without timestamp", raw.zone_id);
            return EngineError::VALIDATION;
        }
        if (!inRange(raw.canopy_temp_c, limits.min_temp_c, limits.max_temp_c)) {
            LOG_WARN(TAG, "Zone %s: canopy temperature %.2f C out of range", raw.zone_id, raw.canopy_temp_c);
            return EngineError::VALIDATION;
        }
        if (!inRange(raw.air_temp_c, limits.min_temp_c, limits.max_temp_c)) {
            LOG_WARN(TAG, "Zone %s: air temperature %.2f C out of range", raw.zone_id, raw.air_temp_c);
            return EngineError::VALIDATION;
        }
        if (raw.has_rh && !inRange(raw.rh_pct, 0.0f, 100.0f)) {
            LOG_WARN(TAG, "Zone %s: relative humidity %.1f%% out of range", raw.zone_id, raw.rh_pct);
            return EngineError::VALIDATION;
        }
        if (raw.has_vpd && !inRange(raw.vpd_kpa, 0.0f, limits.max_vpd_kpa)) {
            LOG_WARN(TAG, "Zone %s: VPD %.2f kPa out of range", raw.zone_id, raw.vpd_kpa);
            return EngineError::VALIDATION;
        }
        if (raw.has_rain && !inRange(raw.rain_mm, 0.0f, limits.max_rain_mm)) {
            LOG_WARN(TAG, "Zone %s: rainfall %.1f mm out of range", raw.zone_id, raw.rain_mm);
            return EngineError::VALIDATION;
        }

        Observation obs{};
        for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
            if (!raw.has_vwc[i]) {
                continue;
            }
            if (!normalizeVwc(raw.vwc[i], limits.vwc_rounding_tolerance, obs.vwc[i])) {
                LOG_WARN(TAG, "Zone %s: VWC %.4f at depth %u out of range",
                         raw.zone_id, raw.vwc[i], static_cast<unsigned>(i));
                return EngineError::VALIDATION;
            }
            obs.depth_mask |= static_cast<uint8_t>(1U << i);
        }

        // Ordering is checked last so a malformed stale record reports the malformation
        if (raw.ts_s <= last_accepted_ts_s) {
            LOG_WARN(TAG, "Zone %s: timestamp %lu not after %lu", raw.zone_id,
                     static_cast<unsigned long>(raw.ts_s), static_cast<unsigned long>(last_accepted_ts_s));
            return EngineError::TEMPORAL_ORDER;
        }

        std::memcpy(obs.zone_id, raw.zone_id, ZONE_ID_LEN);
        obs.ts_s = raw.ts_s;
        obs.canopy_temp_c = raw.canopy_temp_c;
        obs.air_temp_c = raw.air_temp_c;
        obs.has_rh = raw.has_rh;
        obs.rh_pct = raw.has_rh ? raw.rh_pct : 0.0f;
        if (raw.has_vpd) {
            obs.has_vpd = true;
            obs.vpd_kpa = raw.vpd_kpa;
        } else if (raw.has_rh) {
            obs.has_vpd = true;
            obs.vpd_kpa = vpdFromHumidity(raw.air_temp_c, raw.rh_pct);
        }
        obs.rain_mm = raw.has_rain ? raw.rain_mm : 0.0f;

        out_obs = obs;
        return EngineError::NONE;
    }

    EngineError normalize(const RawObservation& raw, uint32_t last_accepted_ts_s, Observation& out_obs) {
        return normalize(raw, last_accepted_ts_s, defaultLimits(), out_obs);
    }
}
