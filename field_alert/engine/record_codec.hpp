#ifndef FIELD_ALERT_RECORD_CODEC_HPP
#define FIELD_ALERT_RECORD_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <field_alert/models/decision_record.hpp>
#include <field_alert/models/engine_error.hpp>
#include <field_alert/models/irrigation_event.hpp>
#include <field_alert/models/observation.hpp>

enum class RecordType : uint8_t {
    OBSERVATION = 0,  // {"type":"observation","zone":..,"ts":..,"canopy_temp_c":..,"air_temp_c":..,
                      //  optional "vwc_6in","vwc_12in","vwc_18in","rh_pct","vpd_kpa","rain_mm"}
    IRRIGATION,       // {"type":"irrigation","zone":..,"ts":..}
    THRESHOLDS        // {"type":"thresholds", "smd_trigger_fraction" and/or "cwsi_trigger"}
};

struct ThresholdUpdate {
    bool  has_smd_trigger;
    float smd_trigger_fraction;
    bool  has_cwsi_trigger;
    float cwsi_trigger;
};

// Only the member matching 'type' is filled
struct ParsedRecord {
    RecordType      type;
    RawObservation  observation;
    IrrigationEvent irrigation;
    ThresholdUpdate thresholds;
};

// JSON wire schema between the engine and its collaborators (mjson, zero allocation)
namespace RecordCodec {
    // Strict: unknown or duplicate keys, wrong value types and missing required
    // keys all fail with VALIDATION. Range checks are left to ObservationIngest.
    EngineError parse(const char* json, int length, ParsedRecord& out_record);

    // Decision payload for the alert collaborator. Returns the payload length,
    // or -1 if it does not fit in out_size.
    int formatDecision(const DecisionRecord& record, char* out, std::size_t out_size);
}

#endif // FIELD_ALERT_RECORD_CODEC_HPP
