#ifndef FIELD_ALERT_IRRIGATION_EVENT_HPP
#define FIELD_ALERT_IRRIGATION_EVENT_HPP

#include <cstdint>
#include <field_alert/models/observation.hpp>

// Notification that a zone was irrigated (dispatch feedback or manual log)
struct IrrigationEvent {
    char     zone_id[ZONE_ID_LEN];
    uint32_t ts_s;
};

#endif // FIELD_ALERT_IRRIGATION_EVENT_HPP
