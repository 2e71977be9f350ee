// Fixed-size container for raw JSON records handed to the ingest task
// by the sensor bridge / weather collaborator.
#ifndef FIELD_ALERT_INGEST_MESSAGE_HPP
#define FIELD_ALERT_INGEST_MESSAGE_HPP

#include <cstdint>

struct IngestMessage {
    uint16_t length;
    char     payload[320];
};

#endif // FIELD_ALERT_INGEST_MESSAGE_HPP
