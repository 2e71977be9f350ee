#include <field_alert/state/runtime_thresholds.hpp>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/irrigation_decision.hpp>
#include <field_alert/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>
#include <freertos/FreeRTOS.h>
#include <freertos/portmacro.h>

static const char* TAG = "RUNTIME_THRESH";
static const char* NVS_NAMESPACE = "thresholds";
static const char* NVS_KEY = "decision";

namespace {
    struct ThresholdData {
        float smd_trigger_fraction;
        float cwsi_trigger;
    };

    static ThresholdData s_session;
    static ThresholdData s_stored;
    static bool s_initialized = false;
    static portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;

    static void loadDefaults(ThresholdData& data) {
        data.smd_trigger_fraction = Config::Decision::smd_trigger_fraction;
        data.cwsi_trigger = Config::Decision::cwsi_trigger;
    }

    static DecisionThresholds toThresholds(const ThresholdData& data) {
        DecisionThresholds t{};
        t.smd_trigger_fraction = data.smd_trigger_fraction;
        t.cwsi_trigger = data.cwsi_trigger;
        return t;
    }

    static bool loadFromNvs(ThresholdData& data) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            return false;
        }

        ThresholdData loaded{};
        size_t required_size = sizeof(ThresholdData);
        err = nvs_get_blob(handle, NVS_KEY, &loaded, &required_size);
        nvs_close(handle);

        if (err != ESP_OK || required_size != sizeof(ThresholdData)) {
            return false;
        }
        // A blob written by older firmware may hold values the policy no longer accepts
        if (IrrigationDecision::validateThresholds(toThresholds(loaded)) != EngineError::NONE) {
            LOG_WARN(TAG, "%s", "Stored thresholds out of range, ignoring");
            return false;
        }
        data = loaded;
        return true;
    }

    static bool saveToNvs(const ThresholdData& data) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS open failed: %d", static_cast<int>(err));
            return false;
        }

        err = nvs_set_blob(handle, NVS_KEY, &data, sizeof(ThresholdData));
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS set_blob failed: %d", static_cast<int>(err));
            nvs_close(handle);
            return false;
        }

        err = nvs_commit(handle);
        nvs_close(handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS commit failed: %d", static_cast<int>(err));
            return false;
        }

        return true;
    }

    // Copy-modify-save; s_stored only changes once NVS has accepted the blob
    template <typename Apply>
    static EngineError update(Apply apply, const char* name, float value) {
        ThresholdData next;
        taskENTER_CRITICAL(&s_mux);
        next = s_stored;
        taskEXIT_CRITICAL(&s_mux);

        apply(next);
        EngineError err = IrrigationDecision::validateThresholds(toThresholds(next));
        if (err != EngineError::NONE) {
            LOG_WARN(TAG, "Rejected %s = %.3f", name, static_cast<double>(value));
            return err;
        }
        if (!saveToNvs(next)) {
            return EngineError::COMPUTATION;
        }

        taskENTER_CRITICAL(&s_mux);
        s_stored = next;
        taskEXIT_CRITICAL(&s_mux);
        LOG_INFO(TAG, "Updated %s to %.3f (applies after restart)", name, static_cast<double>(value));
        return EngineError::NONE;
    }
}

namespace RuntimeThresholds {
    void init() {
        if (s_initialized) {
            return;
        }

        loadDefaults(s_session);

        if (loadFromNvs(s_session)) {
            LOG_INFO(TAG, "Loaded thresholds from NVS (smd %.2f, cwsi %.2f)",
                     static_cast<double>(s_session.smd_trigger_fraction),
                     static_cast<double>(s_session.cwsi_trigger));
        } else {
            LOG_INFO(TAG, "%s", "Using default thresholds (NVS not found or empty)");
            if (!saveToNvs(s_session)) {
                LOG_WARN(TAG, "%s", "Could not seed NVS with default thresholds");
            }
        }

        s_stored = s_session;
        s_initialized = true;
    }

    DecisionThresholds get() {
        return toThresholds(s_session);
    }

    float getSmdTriggerFraction() {
        return s_session.smd_trigger_fraction;
    }

    float getCwsiTrigger() {
        return s_session.cwsi_trigger;
    }

    DecisionThresholds getPending() {
        taskENTER_CRITICAL(&s_mux);
        ThresholdData data = s_stored;
        taskEXIT_CRITICAL(&s_mux);
        return toThresholds(data);
    }

    EngineError setSmdTriggerFraction(float value) {
        return update([value](ThresholdData& d) { d.smd_trigger_fraction = value; },
                      "smd_trigger_fraction", value);
    }

    EngineError setCwsiTrigger(float value) {
        return update([value](ThresholdData& d) { d.cwsi_trigger = value; },
                      "cwsi_trigger", value);
    }
}
