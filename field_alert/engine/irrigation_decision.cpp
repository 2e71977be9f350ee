#include <field_alert/engine/irrigation_decision.hpp>
#include <field_alert/engine/observation_ingest.hpp>
#include <cmath>
#include <cstring>

namespace {
    static bool isTriggerFraction(float v) {
        return std::isfinite(v) && v > 0.0f && v <= 1.0f;
    }
}

namespace IrrigationDecision {
    EngineError validateThresholds(const DecisionThresholds& thresholds) {
        if (!isTriggerFraction(thresholds.smd_trigger_fraction) || !isTriggerFraction(thresholds.cwsi_trigger)) {
            return EngineError::CONFIG;
        }
        return EngineError::NONE;
    }

    EngineError evaluate(const char* zone_id,
                         const WaterBalanceState& balance,
                         const CwsiState& cwsi,
                         const DecisionThresholds& thresholds,
                         DecisionRecord& out_record) {
        if (!ObservationIngest::isValidZoneId(zone_id)) {
            return EngineError::VALIDATION;
        }
        EngineError err = validateThresholds(thresholds);
        if (err != EngineError::NONE) {
            return err;
        }
        if (!(balance.whc_mm > 0.0f) || !std::isfinite(balance.smd_mm)) {
            return EngineError::COMPUTATION;
        }

        const float smd_fraction = balance.smdFraction();
        const bool smd_exceeded = smd_fraction >= thresholds.smd_trigger_fraction;
        const bool cwsi_exceeded = cwsi.valid && cwsi.index >= thresholds.cwsi_trigger;

        DecisionRecord rec{};
        std::strncpy(rec.zone_id, zone_id, ZONE_ID_LEN - 1);
        rec.ts_s = balance.last_update_ts_s;
        rec.smd_mm = balance.smd_mm;
        rec.whc_mm = balance.whc_mm;
        rec.smd_fraction = smd_fraction;
        rec.cwsi = cwsi.valid ? cwsi.index : 0.0f;
        rec.cwsi_valid = cwsi.valid;
        rec.rationale = (smd_exceeded && cwsi_exceeded) ? DecisionRationale::BOTH
                        : smd_exceeded                  ? DecisionRationale::SMD_EXCEEDED
                        : cwsi_exceeded                 ? DecisionRationale::CWSI_EXCEEDED
                                                        : DecisionRationale::NONE;
        rec.triggered = (rec.rationale != DecisionRationale::NONE);
        rec.thresholds = thresholds;

        out_record = rec;
        return EngineError::NONE;
    }
}
