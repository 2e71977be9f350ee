#ifndef FIELD_ALERT_ALERT_TASK_HPP
#define FIELD_ALERT_ALERT_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace AlertTask {
    // Consumes DecisionRecords from decision_queue and emits the JSON payload
    // for the alert transport
    void create(QueueHandle_t decision_queue);
}

#endif // FIELD_ALERT_ALERT_TASK_HPP
