#ifndef FIELD_ALERT_ALERT_DISPATCHER_HPP
#define FIELD_ALERT_ALERT_DISPATCHER_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <field_alert/models/decision_record.hpp>

// Receiver of finished decisions. Delivery (MQTT, e-mail, dashboard) lives
// behind this boundary; dispatch() must not block.
class AlertDispatcher {
public:
    virtual ~AlertDispatcher() = default;

    // Returns false when the record could not be handed over
    virtual bool dispatch(const DecisionRecord& record) = 0;
};

// Hands decisions to a FreeRTOS queue of DecisionRecord (non-blocking)
class QueueAlertDispatcher : public AlertDispatcher {
public:
    explicit QueueAlertDispatcher(QueueHandle_t decision_queue);

    bool dispatch(const DecisionRecord& record) override;

private:
    QueueHandle_t queue;
    uint32_t dropped;
};

#endif // FIELD_ALERT_ALERT_DISPATCHER_HPP
