#include <field_alert/tasks/decision_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <field_alert/config/config.hpp>
#include <field_alert/utils/logger.hpp>

namespace {
    static const char* TAG = "DECISION_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static IrrigationEngine* s_engine = nullptr;

    static void evaluatePending() {
        const std::size_t count = s_engine->zoneCount();
        for (std::size_t i = 0; i < count; ++i) {
            const char* zone_id = s_engine->zoneIdAt(i);
            if (zone_id == nullptr || !s_engine->needsEvaluation(zone_id)) {
                continue;
            }
            DecisionRecord record;
            EngineError err = s_engine->evaluate(zone_id, record);
            if (err != EngineError::NONE) {
                LOG_WARN(TAG, "Zone %s evaluation failed: %s", zone_id, toString(err));
                continue;
            }
            LOG_DEBUG(TAG, "Zone %s smd %.1f/%.1f mm cwsi %.2f%s -> %s",
                      zone_id,
                      static_cast<double>(record.smd_mm),
                      static_cast<double>(record.whc_mm),
                      static_cast<double>(record.cwsi),
                      record.cwsi_valid ? "" : " (invalid)",
                      toString(record.rationale));
        }
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Decision Task started");

        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Decision::period_ms);

        for (;;) {
            evaluatePending();
            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace DecisionTask {
    void create(IrrigationEngine& engine) {
        s_engine = &engine;
        xTaskCreateStatic(taskFunction, "decision_task",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }
}
