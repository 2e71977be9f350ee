#ifndef FIELD_ALERT_DECISION_TASK_HPP
#define FIELD_ALERT_DECISION_TASK_HPP

#include <field_alert/engine/irrigation_engine.hpp>

namespace DecisionTask {
    // Periodically evaluates every zone that received data since its last decision
    void create(IrrigationEngine& engine);
}

#endif // FIELD_ALERT_DECISION_TASK_HPP
