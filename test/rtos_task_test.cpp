#include "os/rtos.hpp"
#include <iostream>

#define T_ASSERT(expr) do { if (!(expr)) { std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } } while (0)

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static void SetFlag(void* arg) {
    *static_cast<int*>(arg) = 42;
}

struct CounterCtx {
    Rtos::Mutex* lock;
    long* counter;
    int iterations;
};

static void Increment(void* arg) {
    auto* ctx = static_cast<CounterCtx*>(arg);
    for (int i = 0; i < ctx->iterations; ++i) {
        ctx->lock->lock();
        ++(*ctx->counter);
        ctx->lock->unlock();
    }
}

static bool testCreateJoin() {
    int flag = 0;
    Rtos::Task task;
    T_ASSERT(!task.Running());

    T_ASSERT(task.Create("SetFlag", SetFlag, &flag));
    T_ASSERT(task.Running());
    task.Join();
    T_ASSERT(!task.Running());
    T_ASSERT(flag == 42);

    // Joined tasks can be reused; joining twice is harmless
    flag = 0;
    T_ASSERT(task.Create("SetFlagAgainWithALongName", SetFlag, &flag));
    task.Join();
    task.Join();
    T_ASSERT(flag == 42);
    return true;
}

static bool testDoubleCreateRejected() {
    Rtos::Mutex gate;
    long counter = 0;
    CounterCtx ctx{&gate, &counter, 1000};

    Rtos::Task task;
    T_ASSERT(task.Create("Counter", Increment, &ctx));
    T_ASSERT(!task.Create("Counter", Increment, &ctx));
    task.Join();
    T_ASSERT(counter == 1000);
    return true;
}

static bool testMutexCounter() {
    constexpr int TASKS = 4;
    constexpr int ITER  = 20000;

    Rtos::Mutex lock;
    long counter = 0;
    CounterCtx ctx{&lock, &counter, ITER};

    Rtos::Task tasks[TASKS];
    for (auto& t : tasks) T_ASSERT(t.Create("Worker", Increment, &ctx));
    for (auto& t : tasks) t.Join();

    std::cout << "  counter=" << counter << "\n";
    T_ASSERT(counter == static_cast<long>(TASKS) * ITER);
    return true;
}

int main() {
    std::cout << "=== rtos_task_test ===\n";
    int failed = 0;

    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"create / join", testCreateJoin},
        {"second create while running", testDoubleCreateRejected},
        {"mutex across 4 tasks", testMutexCounter},
    };

    int idx = 0;
    for (const auto& c : cases) {
        std::cout << "\n[Test " << idx++ << "] " << c.name << "\n";
        const bool ok = c.fn();
        printResult(c.name, ok);
        if (!ok) ++failed;
    }

    std::cout << "\nrtos_task_test: " << (failed ? "FAIL" : "PASS") << "\n";
    return failed ? 1 : 0;
}
