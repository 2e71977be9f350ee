#include <field_alert/tasks/ingest_task.hpp>
#include <freertos/task.h>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/record_codec.hpp>
#include <field_alert/models/ingest_message.hpp>
#include <field_alert/state/runtime_thresholds.hpp>
#include <field_alert/utils/logger.hpp>

namespace {
    static const char* TAG = "INGEST_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static QueueHandle_t s_ingest_queue = nullptr;
    static IrrigationEngine* s_engine = nullptr;

    static void applyThresholds(const ThresholdUpdate& update) {
        if (update.has_smd_trigger) {
            EngineError err = RuntimeThresholds::setSmdTriggerFraction(update.smd_trigger_fraction);
            if (err != EngineError::NONE) {
                LOG_ERROR(TAG, "smd_trigger_fraction update failed: %s", toString(err));
            }
        }
        if (update.has_cwsi_trigger) {
            EngineError err = RuntimeThresholds::setCwsiTrigger(update.cwsi_trigger);
            if (err != EngineError::NONE) {
                LOG_ERROR(TAG, "cwsi_trigger update failed: %s", toString(err));
            }
        }
    }

    static void handleMessage(const IngestMessage& msg) {
        if (msg.length == 0 || msg.length > sizeof(msg.payload)) {
            LOG_WARN(TAG, "Dropped message with bad length %u", static_cast<unsigned>(msg.length));
            return;
        }

        ParsedRecord rec;
        EngineError err = RecordCodec::parse(msg.payload, static_cast<int>(msg.length), rec);
        if (err != EngineError::NONE) {
            LOG_WARN(TAG, "Rejected record: %.*s", static_cast<int>(msg.length), msg.payload);
            return;
        }

        switch (rec.type) {
            case RecordType::OBSERVATION: {
                Observation obs;
                // Rejections are logged by the engine
                if (s_engine->ingest(rec.observation, obs) == EngineError::NONE) {
                    LOG_DEBUG(TAG, "Zone %s observation at %lu applied", obs.zone_id,
                              static_cast<unsigned long>(obs.ts_s));
                }
                break;
            }
            case RecordType::IRRIGATION:
                if (s_engine->recordIrrigationEvent(rec.irrigation.zone_id, rec.irrigation.ts_s) == EngineError::NONE) {
                    LOG_INFO(TAG, "Zone %s irrigated at %lu", rec.irrigation.zone_id,
                             static_cast<unsigned long>(rec.irrigation.ts_s));
                }
                break;
            case RecordType::THRESHOLDS:
                applyThresholds(rec.thresholds);
                break;
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Ingest Task started");

        IngestMessage msg;
        for (;;) {
            if (xQueueReceive(s_ingest_queue, &msg, portMAX_DELAY) != pdTRUE) {
                continue;
            }
            handleMessage(msg);
        }
    }
}

namespace IngestTask {
    void create(QueueHandle_t ingest_queue, IrrigationEngine& engine) {
        s_ingest_queue = ingest_queue;
        s_engine = &engine;
        xTaskCreateStatic(taskFunction,
                          "ingest_task",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::HIGH,
                          s_task_stack,
                          &s_task_tcb);
    }
}
