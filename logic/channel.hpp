/*
 * Channel / Signal - Inter-task messaging for the cooperative executor
 * Pure logic, no SDK dependency. Testable on host.
 *
 * Channel<T, N>: bounded FIFO. try_send() refuses when full, so a producer
 * holds its event and retries on its next poll (backpressure). With N = 1 at
 * most one event is ever in flight.
 *
 * Signal<T>: single slot, latest value wins, consumed by take().
 */

#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <cstddef>
#include <cstdint>

template <typename T, size_t N>
class Channel {
    static_assert(N > 0U, "Channel capacity must be at least 1");

public:
    Channel() = default;
    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    /* Returns false (event not taken) when the channel is full */
    bool try_send(const T &item) {
        if (count_ == N) {
            return false;
        }
        slots_[(head_ + count_) % N] = item;
        count_++;
        return true;
    }

    /* Returns false when empty */
    bool try_receive(T &out) {
        if (count_ == 0U) {
            return false;
        }
        out = slots_[head_];
        head_ = (head_ + 1U) % N;
        count_--;
        return true;
    }

    bool full() const { return count_ == N; }
    bool empty() const { return count_ == 0U; }
    size_t size() const { return count_; }
    static constexpr size_t capacity() { return N; }

private:
    T slots_[N] = {};
    size_t head_ = 0;
    size_t count_ = 0;
};

template <typename T>
class Signal {
public:
    Signal() = default;
    Signal(const Signal &) = delete;
    Signal &operator=(const Signal &) = delete;

    /* Overwrites any value not yet taken */
    void signal(const T &value) {
        value_ = value;
        pending_ = true;
    }

    bool signaled() const { return pending_; }

    /* Consume the pending value; returns false if none */
    bool take(T &out) {
        if (!pending_) {
            return false;
        }
        out = value_;
        pending_ = false;
        return true;
    }

    void reset() { pending_ = false; }

private:
    T value_ = {};
    bool pending_ = false;
};

#endif // CHANNEL_HPP
