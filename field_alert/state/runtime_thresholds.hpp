#ifndef FIELD_ALERT_RUNTIME_THRESHOLDS_HPP
#define FIELD_ALERT_RUNTIME_THRESHOLDS_HPP

#include <field_alert/models/decision_record.hpp>
#include <field_alert/models/engine_error.hpp>

// Trigger thresholds persisted in NVS.
//
// Values are read once by init() and stay fixed for the session; setters
// validate, persist and take effect at the next start.
namespace RuntimeThresholds {
    // Load from NVS, or seed NVS with the Config::Decision defaults
    void init();

    // Session values
    DecisionThresholds get();
    float getSmdTriggerFraction();
    float getCwsiTrigger();

    // Stored values applied at next start
    DecisionThresholds getPending();

    // CONFIG for a value outside (0, 1]; COMPUTATION if NVS refused the write
    EngineError setSmdTriggerFraction(float value);
    EngineError setCwsiTrigger(float value);
}

#endif // FIELD_ALERT_RUNTIME_THRESHOLDS_HPP
