#pragma once

namespace Rtos {

//== Task abstraction ==//
// Thin wrapper over a native thread. Create() starts fn(arg) immediately;
// Join() waits for it. A task that is never joined is detached on destruction.
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // False if the thread could not be started (fn is not run).
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
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

} // namespace Rtos
