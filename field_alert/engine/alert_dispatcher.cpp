#include <field_alert/engine/alert_dispatcher.hpp>
#include <field_alert/utils/logger.hpp>

namespace {
    static const char* TAG = "DISPATCH";
}

QueueAlertDispatcher::QueueAlertDispatcher(QueueHandle_t decision_queue)
    : queue(decision_queue), dropped(0) {}

bool QueueAlertDispatcher::dispatch(const DecisionRecord& record) {
    if (queue == nullptr) {
        return false;
    }
    if (xQueueSend(queue, &record, 0) != pdTRUE) {
        ++dropped;
        LOG_WARN(TAG, "Decision queue full, dropped decision for zone %s (%lu dropped)",
                 record.zone_id, static_cast<unsigned long>(dropped));
        return false;
    }
    return true;
}
