#ifndef FIELD_ALERT_MUTEX_GUARD_HPP
#define FIELD_ALERT_MUTEX_GUARD_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Scoped lock over a FreeRTOS mutex semaphore. A null handle is a no-op.
class MutexGuard {
public:
    explicit MutexGuard(SemaphoreHandle_t mutex_in)
        : mutex(mutex_in), locked(false) {
        if (mutex != nullptr) {
            locked = (xSemaphoreTake(mutex, portMAX_DELAY) == pdTRUE);
        }
    }

    ~MutexGuard() {
        if (locked) {
            (void)xSemaphoreGive(mutex);
        }
    }

    bool isLocked() const {
        return locked;
    }

    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;

private:
    SemaphoreHandle_t mutex;
    bool locked;
};

#endif // FIELD_ALERT_MUTEX_GUARD_HPP
