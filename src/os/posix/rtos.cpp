#include "os/rtos.hpp"
#include <pthread.h>
#include <cstring>
#include <iostream>   // for std::cerr

namespace Rtos {

// =======================
// Task Implementation
// =======================

// Wrapper to convert function pointer to pthread-style
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

// Static thread entry point
static void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
};

Task::Task() {
    handle_ = new TaskHandle{};
}

Task::~Task() {
    if (handle_ && !handle_->joined && handle_->created) {
        pthread_detach(handle_->thread);  // detach if not joined
    }
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created && !handle_->joined) {
        std::cerr << "[Rtos] task '" << (name ? name : "?") << "' already running\n";
        return false;
    }

    auto* args = new ThreadArgs{fn, arg};

    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[Rtos] failed to create task '" << (name ? name : "?")
                  << "': " << std::strerror(rc) << "\n";
        delete args;
        return false;
    }

    handle_->created = true;
    handle_->joined = false;

#if defined(__linux__)
    if (name) {
        // Linux limits thread names to 15 chars + NUL
        char buf[16];
        std::strncpy(buf, name, sizeof(buf) - 1);
        buf[sizeof(buf) - 1] = '\0';
        pthread_setname_np(handle_->thread, buf);
    }
#endif
    return true;
}

void Task::Join() {
    if (handle_ && handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

bool Task::Running() const {
    return handle_ && handle_->created && !handle_->joined;
}

// =======================
// Mutex Implementation
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() {
    handle_ = new MutexHandle;
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "[Rtos] mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

} // namespace Rtos
