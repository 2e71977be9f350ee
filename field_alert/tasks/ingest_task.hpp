#ifndef FIELD_ALERT_INGEST_TASK_HPP
#define FIELD_ALERT_INGEST_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <field_alert/engine/irrigation_engine.hpp>

namespace IngestTask {
    // Drains IngestMessage JSON records from ingest_queue into the engine.
    // Threshold records are persisted through RuntimeThresholds.
    void create(QueueHandle_t ingest_queue, IrrigationEngine& engine);
}

#endif // FIELD_ALERT_INGEST_TASK_HPP
