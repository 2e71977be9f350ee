#ifndef FIELD_ALERT_IRRIGATION_DECISION_HPP
#define FIELD_ALERT_IRRIGATION_DECISION_HPP

#include <field_alert/models/cwsi_state.hpp>
#include <field_alert/models/decision_record.hpp>
#include <field_alert/models/engine_error.hpp>
#include <field_alert/models/water_balance_state.hpp>

// Irrigation trigger policy. Pure: the record depends only on the arguments.
//   SMD / WHC >= smd_trigger_fraction  -> SMD_EXCEEDED
//   CWSI      >= cwsi_trigger          -> CWSI_EXCEEDED
//   both                               -> BOTH
// triggered is the OR of the two; an invalid CWSI never exceeds.
namespace IrrigationDecision {
    // Both thresholds must be finite and in (0, 1]
    EngineError validateThresholds(const DecisionThresholds& thresholds);

    EngineError evaluate(const char* zone_id,
                         const WaterBalanceState& balance,
                         const CwsiState& cwsi,
                         const DecisionThresholds& thresholds,
                         DecisionRecord& out_record);
}

#endif // FIELD_ALERT_IRRIGATION_DECISION_HPP
