#ifndef FIELD_ALERT_CIRCULAR_BUFFER_HPP
#define FIELD_ALERT_CIRCULAR_BUFFER_HPP

#include <cstddef>
#include <array>

// Fixed-capacity, header-only ring of the most recent items.
// - No dynamic allocation (storage is embedded).
// - No internal locking; the owner serializes access.
// - Items are addressed oldest-first: at(0) is the oldest, at(size()-1) the newest.
template<typename T, std::size_t Capacity>
class CircularBuffer {
public:
    static_assert(Capacity > 0, "CircularBuffer capacity must be greater than zero");

    CircularBuffer() : head_index(0), count(0) {}

    // Append; when full the oldest item is evicted. Returns true if an item was evicted.
    bool pushOverwrite(const T& value) {
        storage[head_index] = value;
        head_index = (head_index + 1U) % Capacity;
        if (count == Capacity) {
            return true;
        }
        ++count;
        return false;
    }

    // Append only if there is room
    bool push(const T& value) {
        if (isFull()) {
            return false;
        }
        (void)pushOverwrite(value);
        return true;
    }

    const T& at(std::size_t index) const {
        return storage[(oldestIndex() + index) % Capacity];
    }

    bool newest(T& out_value) const {
        if (isEmpty()) {
            return false;
        }
        out_value = storage[(head_index + Capacity - 1U) % Capacity];
        return true;
    }

    // Copy up to max_items, oldest first; returns the number copied
    std::size_t copyTo(T* out, std::size_t max_items) const {
        std::size_t n = (count < max_items) ? count : max_items;
        // Keep the newest n when the caller's buffer is short
        std::size_t skip = count - n;
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = at(skip + i);
        }
        return n;
    }

    bool isFull() const {
        return count == Capacity;
    }

    bool isEmpty() const {
        return count == 0U;
    }

    std::size_t size() const {
        return count;
    }

    std::size_t capacity() const {
        return Capacity;
    }

    void clear() {
        head_index = 0U;
        count = 0U;
    }

private:
    std::size_t oldestIndex() const {
        return (head_index + Capacity - count) % Capacity;
    }

    std::array<T, Capacity> storage;
    std::size_t head_index;
    std::size_t count;
};

#endif // FIELD_ALERT_CIRCULAR_BUFFER_HPP
