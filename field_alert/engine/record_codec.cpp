#include <field_alert/engine/record_codec.hpp>
#include <field_alert/utils/logger.hpp>
#include <mjson.h>
#include <cmath>
#include <cstring>

namespace {
    static const char* TAG = "CODEC";

    struct FieldSpec {
        const char* key;
        int         token;     // expected MJSON_TOK_* of the value
        bool        required;
    };

    static constexpr std::size_t MAX_FIELDS = 11;

    static const FieldSpec OBSERVATION_FIELDS[] = {
        { "type",          MJSON_TOK_STRING, true  },
        { "zone",          MJSON_TOK_STRING, true  },
        { "ts",            MJSON_TOK_NUMBER, true  },
        { "canopy_temp_c", MJSON_TOK_NUMBER, true  },
        { "air_temp_c",    MJSON_TOK_NUMBER, true  },
        { "vwc_6in",       MJSON_TOK_NUMBER, false },
        { "vwc_12in",      MJSON_TOK_NUMBER, false },
        { "vwc_18in",      MJSON_TOK_NUMBER, false },
        { "rh_pct",        MJSON_TOK_NUMBER, false },
        { "vpd_kpa",       MJSON_TOK_NUMBER, false },
        { "rain_mm",       MJSON_TOK_NUMBER, false },
    };

    static const FieldSpec IRRIGATION_FIELDS[] = {
        { "type", MJSON_TOK_STRING, true },
        { "zone", MJSON_TOK_STRING, true },
        { "ts",   MJSON_TOK_NUMBER, true },
    };

    static const FieldSpec THRESHOLD_FIELDS[] = {
        { "type",                 MJSON_TOK_STRING, true  },
        { "smd_trigger_fraction", MJSON_TOK_NUMBER, false },
        { "cwsi_trigger",         MJSON_TOK_NUMBER, false },
    };

    // Same order as the depth indices
    static const char* const VWC_PATHS[SOIL_DEPTH_COUNT] = { "$.vwc_6in", "$.vwc_12in", "$.vwc_18in" };

    // Every key must be in the schema, appear once and carry the expected type;
    // every required key must be present
    static bool checkSchema(const char* json, int length, const FieldSpec* fields, std::size_t field_count) {
        bool seen[MAX_FIELDS] = {};
        int koff = 0, klen = 0, voff = 0, vlen = 0, vtype = 0;
        int off = 0;
        while ((off = mjson_next(json, length, off, &koff, &klen, &voff, &vlen, &vtype)) != 0) {
            // Keys come back quoted
            const char* key = json + koff + 1;
            const std::size_t key_len = (klen >= 2) ? static_cast<std::size_t>(klen - 2) : 0U;
            std::size_t match = field_count;
            for (std::size_t i = 0; i < field_count; ++i) {
                if (std::strlen(fields[i].key) == key_len && std::strncmp(fields[i].key, key, key_len) == 0) {
                    match = i;
                    break;
                }
            }
            if (match == field_count) {
                LOG_WARN(TAG, "Unknown field '%.*s'", static_cast<int>(key_len), key);
                return false;
            }
            if (seen[match]) {
                LOG_WARN(TAG, "Duplicate field '%s'", fields[match].key);
                return false;
            }
            if (vtype != fields[match].token) {
                LOG_WARN(TAG, "Field '%s' has the wrong type", fields[match].key);
                return false;
            }
            seen[match] = true;
        }
        for (std::size_t i = 0; i < field_count; ++i) {
            if (fields[i].required && !seen[i]) {
                LOG_WARN(TAG, "Missing field '%s'", fields[i].key);
                return false;
            }
        }
        return true;
    }

    static bool getFloat(const char* json, int length, const char* path, float& out) {
        double v = 0.0;
        if (mjson_get_number(json, length, path, &v) != 1) {
            return false;
        }
        out = static_cast<float>(v);
        return true;
    }

    static bool getZone(const char* json, int length, char* out) {
        char zone[ZONE_ID_LEN];
        int n = mjson_get_string(json, length, "$.zone", zone, sizeof(zone));
        if (n <= 0 || n >= static_cast<int>(sizeof(zone))) {
            LOG_WARN(TAG, "%s", "Zone id missing, empty or too long");
            return false;
        }
        zone[n] = '\0';
        std::memcpy(out, zone, sizeof(zone));
        return true;
    }

    static bool getTimestamp(const char* json, int length, uint32_t& out) {
        double v = 0.0;
        if (mjson_get_number(json, length, "$.ts", &v) != 1) {
            return false;
        }
        if (!std::isfinite(v) || v < 1.0 || v > 4294967295.0 || std::floor(v) != v) {
            LOG_WARN(TAG, "Invalid timestamp %.1f", v);
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }

    static EngineError parseObservation(const char* json, int length, RawObservation& out) {
        if (!checkSchema(json, length, OBSERVATION_FIELDS,
                         sizeof(OBSERVATION_FIELDS) / sizeof(OBSERVATION_FIELDS[0]))) {
            return EngineError::VALIDATION;
        }
        RawObservation raw{};
        if (!getZone(json, length, raw.zone_id) || !getTimestamp(json, length, raw.ts_s) ||
            !getFloat(json, length, "$.canopy_temp_c", raw.canopy_temp_c) ||
            !getFloat(json, length, "$.air_temp_c", raw.air_temp_c)) {
            return EngineError::VALIDATION;
        }
        for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
            raw.has_vwc[i] = getFloat(json, length, VWC_PATHS[i], raw.vwc[i]);
        }
        raw.has_rh = getFloat(json, length, "$.rh_pct", raw.rh_pct);
        raw.has_vpd = getFloat(json, length, "$.vpd_kpa", raw.vpd_kpa);
        raw.has_rain = getFloat(json, length, "$.rain_mm", raw.rain_mm);
        out = raw;
        return EngineError::NONE;
    }

    static EngineError parseIrrigation(const char* json, int length, IrrigationEvent& out) {
        if (!checkSchema(json, length, IRRIGATION_FIELDS,
                         sizeof(IRRIGATION_FIELDS) / sizeof(IRRIGATION_FIELDS[0]))) {
            return EngineError::VALIDATION;
        }
        IrrigationEvent evt{};
        if (!getZone(json, length, evt.zone_id) || !getTimestamp(json, length, evt.ts_s)) {
            return EngineError::VALIDATION;
        }
        out = evt;
        return EngineError::NONE;
    }

    static EngineError parseThresholds(const char* json, int length, ThresholdUpdate& out) {
        if (!checkSchema(json, length, THRESHOLD_FIELDS,
                         sizeof(THRESHOLD_FIELDS) / sizeof(THRESHOLD_FIELDS[0]))) {
            return EngineError::VALIDATION;
        }
        ThresholdUpdate update{};
        update.has_smd_trigger = getFloat(json, length, "$.smd_trigger_fraction", update.smd_trigger_fraction);
        update.has_cwsi_trigger = getFloat(json, length, "$.cwsi_trigger", update.cwsi_trigger);
        if (!update.has_smd_trigger && !update.has_cwsi_trigger) {
            LOG_WARN(TAG, "%s", "Threshold record without any threshold");
            return EngineError::VALIDATION;
        }
        out = update;
        return EngineError::NONE;
    }
}

namespace RecordCodec {
    EngineError parse(const char* json, int length, ParsedRecord& out_record) {
        if (json == nullptr || length <= 0) {
            return EngineError::VALIDATION;
        }
        const char* tok = nullptr;
        int tok_len = 0;
        if (mjson_find(json, length, "$", &tok, &tok_len) != MJSON_TOK_OBJECT) {
            LOG_WARN(TAG, "%s", "Record is not a JSON object");
            return EngineError::VALIDATION;
        }

        char type[16];
        if (mjson_get_string(json, length, "$.type", type, sizeof(type)) <= 0) {
            LOG_WARN(TAG, "%s", "Record missing 'type'");
            return EngineError::VALIDATION;
        }

        ParsedRecord rec{};
        EngineError err = EngineError::VALIDATION;
        if (std::strcmp(type, "observation") == 0) {
            rec.type = RecordType::OBSERVATION;
            err = parseObservation(json, length, rec.observation);
        } else if (std::strcmp(type, "irrigation") == 0) {
            rec.type = RecordType::IRRIGATION;
            err = parseIrrigation(json, length, rec.irrigation);
        } else if (std::strcmp(type, "thresholds") == 0) {
            rec.type = RecordType::THRESHOLDS;
            err = parseThresholds(json, length, rec.thresholds);
        } else {
            LOG_WARN(TAG, "Unknown record type '%s'", type);
        }
        if (err != EngineError::NONE) {
            return err;
        }
        out_record = rec;
        return EngineError::NONE;
    }

    int formatDecision(const DecisionRecord& record, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n = mjson_snprintf(out, out_size,
                               "{%Q:%Q,%Q:%lu,%Q:%B,%Q:%Q,%Q:%g,%Q:%g,%Q:%g,%Q:%g,%Q:%B,"
                               "%Q:{%Q:%g,%Q:%g}}",
                               "zone", record.zone_id,
                               "ts", static_cast<unsigned long>(record.ts_s),
                               "triggered", record.triggered ? 1 : 0,
                               "rationale", toString(record.rationale),
                               "smd_mm", static_cast<double>(record.smd_mm),
                               "whc_mm", static_cast<double>(record.whc_mm),
                               "smd_fraction", static_cast<double>(record.smd_fraction),
                               "cwsi", static_cast<double>(record.cwsi),
                               "cwsi_valid", record.cwsi_valid ? 1 : 0,
                               "thresholds",
                               "smd_trigger_fraction", static_cast<double>(record.thresholds.smd_trigger_fraction),
                               "cwsi_trigger", static_cast<double>(record.thresholds.cwsi_trigger));
        // A payload that filled the buffer may have been cut short
        if (n <= 0 || static_cast<std::size_t>(n) >= out_size - 1U) {
            return -1;
        }
        return n;
    }
}
