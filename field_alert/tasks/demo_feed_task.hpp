#ifndef FIELD_ALERT_DEMO_FEED_TASK_HPP
#define FIELD_ALERT_DEMO_FEED_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace DemoFeedTask {
    // Bench feed: synthesizes hourly records for every configured zone
    // (ET drying, rain, diurnal temperatures, refill irrigation) and posts
    // them as JSON to ingest_queue
    void create(QueueHandle_t ingest_queue);
}

#endif // FIELD_ALERT_DEMO_FEED_TASK_HPP
