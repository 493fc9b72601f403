#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

void SleepMs(int ms);

// Monotonic clock in microseconds / nanoseconds.
uint64_t NowUs();
uint64_t NowNs();

static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu; // block forever

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();
    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper.
// lock()/unlock() make it usable with std::lock_guard.

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();                        // block until count>0, then --count
    bool take(uint32_t timeout_ms);     // false on timeout
    bool try_take();                    // non-blocking: if count>0 then --count, else false
    void give();                        // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// This templated Queue<T, N> is implemented using a circular buffer,
// and synchronized using the OSAL Mutex and CountingSemaphore primitives.
//
// overwrite=true turns the queue into a "freshest-wins" mailbox: try_send()
// on a full queue drops the oldest item instead of failing. Used for live
// camera frames, where a stale frame is worth less than the newest one.
//
template <typename T, size_t Capacity>
class Queue {
public:
    explicit Queue(bool overwrite = false) : head(0), tail(0), overwrite_(overwrite) {}

    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (timeout_ms == MAX_TIMEOUT) {
            spaceAvailable.take();  // Wait for space
        } else if (!spaceAvailable.take(timeout_ms)) {
            return false;
        }
        push(item);
        dataAvailable.give();   // Signal data is available
        return true;
    }

    bool try_send(const T& item) {
        if (spaceAvailable.try_take()) {
            push(item);
            dataAvailable.give();
            return true;
        }
        if (!overwrite_) return false;

        // Full: steal the oldest slot. If the consumer got there first, the
        // slot it frees is used instead.
        if (!dataAvailable.try_take()) {
            if (!spaceAvailable.try_take()) return false;
            push(item);
            dataAvailable.give();
            return true;
        }
        lock.lock();
        buffer[tail] = T{};
        tail = (tail + 1) % Capacity;
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();
        return true;
    }

    bool receive(T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (timeout_ms == MAX_TIMEOUT) {
            dataAvailable.take();  // Wait for data
        } else if (!dataAvailable.take(timeout_ms)) {
            return false;
        }
        pop(item);
        spaceAvailable.give(); // Signal space is available
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        spaceAvailable.give();
        return true;
    }

private:
    void push(const T& item) {
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        buffer[tail] = T{}; // release anything the slot owns
        tail = (tail + 1) % Capacity;
        lock.unlock();
    }

    T buffer[Capacity];
    size_t head, tail;
    bool overwrite_;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
