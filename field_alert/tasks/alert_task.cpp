#include <field_alert/tasks/alert_task.hpp>
#include <freertos/task.h>
#include <field_alert/config/config.hpp>
#include <field_alert/engine/record_codec.hpp>
#include <field_alert/models/decision_record.hpp>
#include <field_alert/utils/logger.hpp>

namespace {
    static const char* TAG = "ALERT_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static QueueHandle_t s_decision_queue = nullptr;

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Alert Task started");

        DecisionRecord record;
        char payload[320];
        for (;;) {
            if (xQueueReceive(s_decision_queue, &record, portMAX_DELAY) != pdTRUE) {
                continue;
            }
            int len = RecordCodec::formatDecision(record, payload, sizeof(payload));
            if (len < 0) {
                LOG_ERROR(TAG, "Decision payload for zone %s too large", record.zone_id);
                continue;
            }
            // Only triggered decisions are alerts; the rest stay at debug
            if (record.triggered) {
                LOG_INFO(TAG, "IRRIGATE %s", payload);
            } else {
                LOG_DEBUG(TAG, "%s", payload);
            }
        }
    }
}

namespace AlertTask {
    void create(QueueHandle_t decision_queue) {
        s_decision_queue = decision_queue;
        xTaskCreateStatic(taskFunction, "alert_task",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
