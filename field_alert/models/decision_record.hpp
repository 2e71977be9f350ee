#ifndef FIELD_ALERT_DECISION_RECORD_HPP
#define FIELD_ALERT_DECISION_RECORD_HPP

#include <cstdint>
#include <field_alert/models/observation.hpp>

enum class DecisionRationale : uint8_t {
    NONE = 0,
    SMD_EXCEEDED = 1,
    CWSI_EXCEEDED = 2,
    BOTH = 3
};

// Trigger levels; both are fractions in (0, 1]
struct DecisionThresholds {
    float smd_trigger_fraction; // management allowable depletion (SMD / WHC)
    float cwsi_trigger;
};

// One irrigation decision for a zone at one evaluation tick
struct DecisionRecord {
    char               zone_id[ZONE_ID_LEN];
    uint32_t           ts_s;
    float              smd_mm;
    float              whc_mm;
    float              smd_fraction;
    float              cwsi;
    bool               cwsi_valid;
    bool               triggered;
    DecisionRationale  rationale;
    DecisionThresholds thresholds;   // values in force when the decision was made
};

inline const char* toString(DecisionRationale rationale) {
    switch (rationale) {
        case DecisionRationale::NONE:          return "NONE";
        case DecisionRationale::SMD_EXCEEDED:  return "SMD_EXCEEDED";
        case DecisionRationale::CWSI_EXCEEDED: return "CWSI_EXCEEDED";
        case DecisionRationale::BOTH:          return "BOTH";
    }
    return "UNKNOWN";
}

#endif // FIELD_ALERT_DECISION_RECORD_HPP
