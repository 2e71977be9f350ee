#include <field_alert/engine/irrigation_engine.hpp>
#include <field_alert/engine/irrigation_decision.hpp>
#include <field_alert/engine/observation_ingest.hpp>
#include <field_alert/utils/logger.hpp>
#include <field_alert/utils/mutex_guard.hpp>
#include <cstring>

namespace {
    static const char* TAG = "ENGINE";
}

IrrigationEngine::IrrigationEngine(EtEstimator& et_estimator_in, AlertDispatcher* dispatcher_in)
    : et_estimator(et_estimator_in), dispatcher(dispatcher_in), zones(), zone_count(0),
      initialized(false), registry_mutex_buffer(), registry_mutex(nullptr) {}

bool IrrigationEngine::init() {
    if (initialized) {
        return true;
    }
    registry_mutex = xSemaphoreCreateMutexStatic(&registry_mutex_buffer);
    if (registry_mutex == nullptr) {
        LOG_ERROR(TAG, "%s", "Registry mutex creation failed");
        return false;
    }
    for (auto& zone : zones) {
        zone.mutex = xSemaphoreCreateMutexStatic(&zone.mutex_buffer);
        if (zone.mutex == nullptr) {
            LOG_ERROR(TAG, "%s", "Zone mutex creation failed");
            return false;
        }
    }
    initialized = true;
    return true;
}

EngineError IrrigationEngine::checkZoneConfig(const char* zone_id, const SoilProfile& profile,
                                              const DecisionThresholds& thresholds, const CwsiBaseline* calibrated,
                                              CwsiBaseline& out_baseline) {
    if (!ObservationIngest::isValidZoneId(zone_id)) {
        LOG_ERROR(TAG, "%s", "Invalid zone id in configuration");
        return EngineError::VALIDATION;
    }
    if (!profile.isConfigured()) {
        LOG_ERROR(TAG, "Zone %s: soil profile not configured", zone_id);
        return EngineError::CONFIG;
    }
    if (IrrigationDecision::validateThresholds(thresholds) != EngineError::NONE) {
        LOG_ERROR(TAG, "Zone %s: invalid thresholds (SMD %.3f, CWSI %.3f)", zone_id,
                  thresholds.smd_trigger_fraction, thresholds.cwsi_trigger);
        return EngineError::CONFIG;
    }
    if (calibrated != nullptr) {
        if (!CwsiCalculator(*calibrated, false).isConfigured()) {
            LOG_ERROR(TAG, "Zone %s: calibrated CWSI baseline is not finite", zone_id);
            return EngineError::CONFIG;
        }
        out_baseline = *calibrated;
    } else if (!CwsiCalculator::baselineForCrop(profile.config().crop, out_baseline)) {
        LOG_ERROR(TAG, "Zone %s: no CWSI baseline for crop %s", zone_id, toString(profile.config().crop));
        return EngineError::CONFIG;
    }
    return EngineError::NONE;
}

void IrrigationEngine::setupZone(ZoneUnit& zone, const char* zone_id, const SoilProfile& profile,
                                 const DecisionThresholds& thresholds, const CwsiBaseline& baseline) {
    std::memset(zone.zone_id, 0, sizeof(zone.zone_id));
    std::strncpy(zone.zone_id, zone_id, ZONE_ID_LEN - 1);
    zone.profile = profile;
    zone.thresholds = thresholds;
    zone.tracker = WaterBalanceTracker(&zone.profile, &et_estimator, Config::WaterBalance::sensor_trust);
    zone.cwsi = CwsiCalculator(baseline);
    zone.history.clear();
    zone.pending_evaluation = false;
}

EngineError IrrigationEngine::configureZone(const char* zone_id, const SoilProfile& profile,
                                            const DecisionThresholds& thresholds) {
    return addZone(zone_id, profile, thresholds, nullptr);
}

EngineError IrrigationEngine::configureZone(const char* zone_id, const SoilProfile& profile,
                                            const DecisionThresholds& thresholds, const CwsiBaseline& baseline) {
    return addZone(zone_id, profile, thresholds, &baseline);
}

EngineError IrrigationEngine::addZone(const char* zone_id, const SoilProfile& profile,
                                      const DecisionThresholds& thresholds, const CwsiBaseline* calibrated) {
    if (!initialized) {
        return EngineError::CONFIG;
    }
    CwsiBaseline baseline{};
    EngineError err = checkZoneConfig(zone_id, profile, thresholds, calibrated, baseline);
    if (err != EngineError::NONE) {
        return err;
    }

    MutexGuard registry_lock(registry_mutex);
    if (findZoneLocked(zone_id) != nullptr) {
        LOG_ERROR(TAG, "Zone %s: already configured", zone_id);
        return EngineError::CONFIG;
    }
    if (zone_count >= zones.size()) {
        LOG_ERROR(TAG, "Zone %s: zone table full (%u zones)", zone_id, static_cast<unsigned>(zones.size()));
        return EngineError::CAPACITY;
    }
    ZoneUnit& zone = zones[zone_count];
    {
        MutexGuard zone_lock(zone.mutex);
        setupZone(zone, zone_id, profile, thresholds, baseline);
    }
    ++zone_count;

    LOG_INFO(TAG, "Zone %s configured: %s, %s, WHC %.1f mm, triggers SMD %.0f%% / CWSI %.2f",
             zone_id, toString(profile.config().texture), toString(profile.config().crop),
             profile.effectiveWhcMm(), thresholds.smd_trigger_fraction * 100.0f, thresholds.cwsi_trigger);
    return EngineError::NONE;
}

EngineError IrrigationEngine::reconfigureZone(const char* zone_id, const SoilProfile& profile,
                                              const DecisionThresholds& thresholds) {
    CwsiBaseline baseline{};
    EngineError err = checkZoneConfig(zone_id, profile, thresholds, nullptr, baseline);
    if (err != EngineError::NONE) {
        return err;
    }
    ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    MutexGuard lock(zone->mutex);
    setupZone(*zone, zone_id, profile, thresholds, baseline);
    LOG_INFO(TAG, "Zone %s reconfigured, state and history reset", zone_id);
    return EngineError::NONE;
}

EngineError IrrigationEngine::ingest(const RawObservation& raw, Observation& out_obs) {
    if (!ObservationIngest::isValidZoneId(raw.zone_id)) {
        logRejection("?", "observation", EngineError::VALIDATION);
        return EngineError::VALIDATION;
    }
    ZoneUnit* zone = findZone(raw.zone_id);
    if (zone == nullptr) {
        logRejection(raw.zone_id, "observation", EngineError::UNKNOWN_ZONE);
        return EngineError::UNKNOWN_ZONE;
    }

    MutexGuard lock(zone->mutex);
    // Ordering is over the observation stream; logged irrigations do not take part
    const WaterBalanceState& balance = zone->tracker.state();
    const uint32_t last_ts =
        (zone->tracker.hasState() && balance.has_observation) ? balance.last_observation_ts_s : 0U;
    Observation obs{};
    EngineError err = ObservationIngest::normalize(raw, last_ts, obs);
    if (err != EngineError::NONE) {
        logRejection(zone->zone_id, "observation", err);
        return err;
    }

    // CWSI first: it does not commit, so a failure leaves both states untouched.
    // A canopy reading the baselines cannot resolve only keeps the previous CWSI.
    CwsiState next_cwsi{};
    bool cwsi_ready = false;
    if (obs.has_vpd) {
        err = zone->cwsi.compute(obs.canopy_temp_c, obs.air_temp_c, obs.vpd_kpa, next_cwsi);
        if (err == EngineError::NONE) {
            cwsi_ready = true;
        } else if (err == EngineError::COMPUTATION) {
            LOG_WARN(TAG, "Zone %s: CWSI not updated at VPD %.2f kPa, previous index kept", zone->zone_id,
                     obs.vpd_kpa);
        } else {
            logRejection(zone->zone_id, "observation", err);
            return err;
        }
    }

    WaterBalanceState next_balance{};
    err = zone->tracker.update(obs, next_balance);
    if (err != EngineError::NONE) {
        logRejection(zone->zone_id, "observation", err);
        return err;
    }
    if (cwsi_ready) {
        zone->cwsi.accept(next_cwsi, next_balance.smdFraction(), !next_balance.superseded);
    }
    zone->pending_evaluation = true;

    out_obs = obs;
    return EngineError::NONE;
}

EngineError IrrigationEngine::ingestBatch(const RawObservation* records, std::size_t count,
                                          const std::atomic<bool>* abort_flag, BatchResult& out_result) {
    BatchResult result{};
    result.first_error = EngineError::NONE;
    for (std::size_t i = 0; i < count; ++i) {
        if (abort_flag != nullptr && abort_flag->load()) {
            result.aborted = true;
            LOG_INFO(TAG, "Batch aborted after %u of %u records", static_cast<unsigned>(i),
                     static_cast<unsigned>(count));
            break;
        }
        Observation obs{};
        EngineError err = ingest(records[i], obs);
        if (err == EngineError::NONE) {
            ++result.accepted;
        } else {
            ++result.rejected;
            if (result.first_error == EngineError::NONE) {
                result.first_error = err;
            }
        }
    }
    out_result = result;
    return result.first_error;
}

EngineError IrrigationEngine::recordIrrigationEvent(const char* zone_id, uint32_t ts_s) {
    if (!ObservationIngest::isValidZoneId(zone_id)) {
        logRejection("?", "irrigation event", EngineError::VALIDATION);
        return EngineError::VALIDATION;
    }
    ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        logRejection(zone_id, "irrigation event", EngineError::UNKNOWN_ZONE);
        return EngineError::UNKNOWN_ZONE;
    }

    MutexGuard lock(zone->mutex);
    WaterBalanceState next{};
    EngineError err = zone->tracker.recordIrrigation(ts_s, next);
    if (err != EngineError::NONE) {
        logRejection(zone->zone_id, "irrigation event", err);
        return err;
    }
    zone->pending_evaluation = true;
    LOG_INFO(TAG, "Zone %s: irrigation at %lu, deficit reset to field capacity", zone->zone_id,
             static_cast<unsigned long>(ts_s));
    return EngineError::NONE;
}

EngineError IrrigationEngine::evaluate(const char* zone_id, DecisionRecord& out_record) {
    ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    return evaluateZone(*zone, nullptr, out_record);
}

EngineError IrrigationEngine::evaluate(const char* zone_id, const DecisionThresholds& thresholds,
                                       DecisionRecord& out_record) {
    ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    return evaluateZone(*zone, &thresholds, out_record);
}

EngineError IrrigationEngine::evaluateZone(ZoneUnit& zone, const DecisionThresholds* thresholds,
                                           DecisionRecord& out_record) {
    DecisionRecord record{};
    {
        MutexGuard lock(zone.mutex);
        if (!zone.tracker.hasState()) {
            return EngineError::NO_DATA;
        }
        const DecisionThresholds& in_force = (thresholds != nullptr) ? *thresholds : zone.thresholds;
        EngineError err = IrrigationDecision::evaluate(zone.zone_id, zone.tracker.state(), zone.cwsi.state(),
                                                       in_force, record);
        if (err != EngineError::NONE) {
            logRejection(zone.zone_id, "evaluation", err);
            return err;
        }
        (void)zone.history.pushOverwrite(record);
        zone.pending_evaluation = false;
    }

    LOG_DEBUG(TAG, "Zone %s: %s (SMD %.0f%%, CWSI %.2f)", record.zone_id, toString(record.rationale),
              record.smd_fraction * 100.0f, record.cwsi);
    if (dispatcher != nullptr && !dispatcher->dispatch(record)) {
        LOG_WARN(TAG, "Zone %s: decision not handed to dispatcher", record.zone_id);
    }
    out_record = record;
    return EngineError::NONE;
}

EngineError IrrigationEngine::history(const char* zone_id, DecisionRecord* out_records, std::size_t max_records,
                                      std::size_t& out_count) const {
    const ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    if (out_records == nullptr && max_records > 0) {
        return EngineError::VALIDATION;
    }
    MutexGuard lock(zone->mutex);
    out_count = zone->history.copyTo(out_records, max_records);
    return EngineError::NONE;
}

EngineError IrrigationEngine::waterBalance(const char* zone_id, WaterBalanceState& out_state) const {
    const ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    MutexGuard lock(zone->mutex);
    if (!zone->tracker.hasState()) {
        return EngineError::NO_DATA;
    }
    out_state = zone->tracker.state();
    return EngineError::NONE;
}

EngineError IrrigationEngine::cwsi(const char* zone_id, CwsiState& out_state) const {
    const ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return EngineError::UNKNOWN_ZONE;
    }
    MutexGuard lock(zone->mutex);
    out_state = zone->cwsi.state();
    return EngineError::NONE;
}

bool IrrigationEngine::needsEvaluation(const char* zone_id) const {
    const ZoneUnit* zone = findZone(zone_id);
    if (zone == nullptr) {
        return false;
    }
    MutexGuard lock(zone->mutex);
    return zone->pending_evaluation;
}

std::size_t IrrigationEngine::zoneCount() const {
    MutexGuard registry_lock(registry_mutex);
    return zone_count;
}

const char* IrrigationEngine::zoneIdAt(std::size_t index) const {
    MutexGuard registry_lock(registry_mutex);
    return (index < zone_count) ? zones[index].zone_id : nullptr;
}

std::size_t IrrigationEngine::indexOfLocked(const char* zone_id) const {
    if (zone_id == nullptr) {
        return zone_count;
    }
    for (std::size_t i = 0; i < zone_count; ++i) {
        if (std::strncmp(zones[i].zone_id, zone_id, ZONE_ID_LEN) == 0) {
            return i;
        }
    }
    return zone_count;
}

IrrigationEngine::ZoneUnit* IrrigationEngine::findZoneLocked(const char* zone_id) {
    const std::size_t i = indexOfLocked(zone_id);
    return (i < zone_count) ? &zones[i] : nullptr;
}

const IrrigationEngine::ZoneUnit* IrrigationEngine::findZoneLocked(const char* zone_id) const {
    const std::size_t i = indexOfLocked(zone_id);
    return (i < zone_count) ? &zones[i] : nullptr;
}

IrrigationEngine::ZoneUnit* IrrigationEngine::findZone(const char* zone_id) {
    MutexGuard registry_lock(registry_mutex);
    return findZoneLocked(zone_id);
}

const IrrigationEngine::ZoneUnit* IrrigationEngine::findZone(const char* zone_id) const {
    MutexGuard registry_lock(registry_mutex);
    return findZoneLocked(zone_id);
}

void IrrigationEngine::logRejection(const char* zone_id, const char* what, EngineError err) const {
    // Configuration and numeric failures stall the zone until fixed; bad records do not
    const LogLevel level = (err == EngineError::CONFIG || err == EngineError::COMPUTATION)
                           ? LogLevel::ERROR : LogLevel::WARN;
    Logger::log(level, TAG, "Zone %s: %s rejected (%s)", zone_id, what, toString(err));
}
