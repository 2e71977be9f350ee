#ifndef FIELD_ALERT_IRRIGATION_ENGINE_HPP
#define FIELD_ALERT_IRRIGATION_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <array>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/alert_dispatcher.hpp>
#include <field_alert/engine/cwsi_calculator.hpp>
#include <field_alert/engine/et_estimator.hpp>
#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/engine/water_balance_tracker.hpp>
#include <field_alert/models/decision_record.hpp>
#include <field_alert/models/engine_error.hpp>
#include <field_alert/models/observation.hpp>
#include <field_alert/utils/circular_buffer.hpp>

struct BatchResult {
    std::size_t accepted;
    std::size_t rejected;
    bool        aborted;      // stopped early through the abort flag
    EngineError first_error;  // NONE when every processed record was accepted
};

// Entry point of the decision engine.
//
// Each configured zone is an isolated unit (soil profile, water balance,
// CWSI state, decision history) guarded by its own mutex, so zones can be
// driven from different tasks while updates to one zone stay serialized.
// Every operation reports its outcome as an EngineError; on failure the
// zone is left exactly as it was.
class IrrigationEngine {
public:
    explicit IrrigationEngine(EtEstimator& et_estimator, AlertDispatcher* dispatcher = nullptr);

    // Zone units point into their own storage
    IrrigationEngine(const IrrigationEngine&) = delete;
    IrrigationEngine& operator=(const IrrigationEngine&) = delete;

    // Creates the mutexes. Must be called once before any other method.
    bool init();

    // Zone configuration is loaded once at startup
    EngineError configureZone(const char* zone_id, const SoilProfile& profile, const DecisionThresholds& thresholds);
    // Same, with a field-calibrated CWSI baseline in place of the crop default
    EngineError configureZone(const char* zone_id, const SoilProfile& profile, const DecisionThresholds& thresholds,
                              const CwsiBaseline& baseline);
    // Replaces a zone's configuration and discards its state and history
    EngineError reconfigureZone(const char* zone_id, const SoilProfile& profile, const DecisionThresholds& thresholds);

    // Validates the record and applies it to the zone's water balance and CWSI.
    // A CWSI the baselines cannot resolve keeps the previous one; the water
    // balance is still updated.
    EngineError ingest(const RawObservation& raw, Observation& out_obs);
    // Applies records in order; checks abort_flag (may be null) before each one
    EngineError ingestBatch(const RawObservation* records, std::size_t count,
                            const std::atomic<bool>* abort_flag, BatchResult& out_result);

    EngineError recordIrrigationEvent(const char* zone_id, uint32_t ts_s);

    // Decides on the zone's latest state, appends the record to the zone's
    // history and hands it to the dispatcher
    EngineError evaluate(const char* zone_id, DecisionRecord& out_record);
    EngineError evaluate(const char* zone_id, const DecisionThresholds& thresholds, DecisionRecord& out_record);

    // Oldest first; at most max_records, newest kept when the buffer is short
    EngineError history(const char* zone_id, DecisionRecord* out_records, std::size_t max_records,
                        std::size_t& out_count) const;

    EngineError waterBalance(const char* zone_id, WaterBalanceState& out_state) const;
    EngineError cwsi(const char* zone_id, CwsiState& out_state) const;

    // True when an observation or irrigation arrived since the last decision
    bool needsEvaluation(const char* zone_id) const;

    std::size_t zoneCount() const;
    const char* zoneIdAt(std::size_t index) const;

private:
    struct ZoneUnit {
        char                zone_id[ZONE_ID_LEN];
        SoilProfile         profile;
        DecisionThresholds  thresholds;
        WaterBalanceTracker tracker;
        CwsiCalculator      cwsi;
        CircularBuffer<DecisionRecord, Config::Engine::history_capacity> history;
        bool                pending_evaluation;
        StaticSemaphore_t   mutex_buffer;
        SemaphoreHandle_t   mutex;
    };

    static EngineError checkZoneConfig(const char* zone_id, const SoilProfile& profile,
                                       const DecisionThresholds& thresholds, const CwsiBaseline* calibrated,
                                       CwsiBaseline& out_baseline);
    EngineError addZone(const char* zone_id, const SoilProfile& profile, const DecisionThresholds& thresholds,
                        const CwsiBaseline* calibrated);
    void setupZone(ZoneUnit& zone, const char* zone_id, const SoilProfile& profile,
                   const DecisionThresholds& thresholds, const CwsiBaseline& baseline);
    std::size_t indexOfLocked(const char* zone_id) const;
    ZoneUnit* findZone(const char* zone_id);
    const ZoneUnit* findZone(const char* zone_id) const;
    ZoneUnit* findZoneLocked(const char* zone_id);
    const ZoneUnit* findZoneLocked(const char* zone_id) const;
    EngineError evaluateZone(ZoneUnit& zone, const DecisionThresholds* thresholds, DecisionRecord& out_record);
    void logRejection(const char* zone_id, const char* what, EngineError err) const;

    EtEstimator& et_estimator;
    AlertDispatcher* dispatcher;
    std::array<ZoneUnit, Config::Engine::max_zones> zones;
    std::size_t zone_count;
    bool initialized;
    StaticSemaphore_t registry_mutex_buffer;
    SemaphoreHandle_t registry_mutex;
};

#endif // FIELD_ALERT_IRRIGATION_ENGINE_HPP
