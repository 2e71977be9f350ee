#ifndef FIELD_ALERT_ENGINE_ERROR_HPP
#define FIELD_ALERT_ENGINE_ERROR_HPP

#include <cstdint>

// Result codes returned by every engine operation.
// NONE means success; anything else leaves the zone's state as it was.
enum class EngineError : uint8_t {
    NONE = 0,
    VALIDATION,      // malformed or out-of-range record
    TEMPORAL_ORDER,  // timestamp not after the zone's last accepted one
    CONFIG,          // missing/invalid soil profile, baseline or thresholds
    COMPUTATION,     // degenerate numeric case (e.g. zero baseline spread)
    UNKNOWN_ZONE,    // zone id not configured
    NO_DATA,         // nothing accepted yet for the zone
    CAPACITY         // fixed-size zone table is full
};

inline const char* toString(EngineError err) {
    switch (err) {
        case EngineError::NONE:           return "ok";
        case EngineError::VALIDATION:     return "validation error";
        case EngineError::TEMPORAL_ORDER: return "temporal order error";
        case EngineError::CONFIG:         return "config error";
        case EngineError::COMPUTATION:    return "computation error";
        case EngineError::UNKNOWN_ZONE:   return "unknown zone";
        case EngineError::NO_DATA:        return "no data";
        case EngineError::CAPACITY:       return "capacity exceeded";
    }
    return "unknown error";
}

#endif // FIELD_ALERT_ENGINE_ERROR_HPP
