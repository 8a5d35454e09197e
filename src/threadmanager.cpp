#include "threadmanager.h"
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace lanmeet {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
    LOG_THREAD_DEBUG("ThreadManager initialized");
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
    LOG_THREAD_DEBUG("ThreadManager destroyed");
}

bool ThreadManager::add_managed_thread(std::function<void()> body, const std::string& name) {
    cleanup_finished_threads();

    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Not starting thread during shutdown: " << name);
        return false;
    }

    ManagedThread managed;
    managed.name = name;
    managed.finished = std::make_shared<std::atomic<bool>>(false);

    auto finished = managed.finished;
    managed.thread = std::thread([body, finished]() {
        body();
        finished->store(true);
    });

    active_threads_.push_back(std::move(managed));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

void ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        for (auto it = active_threads_.begin(); it != active_threads_.end();) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& managed : finished_threads) {
        LOG_THREAD_DEBUG("Reaping finished thread: " << managed.name);
        join_thread(managed);
    }
}

void ThreadManager::shutdown_all_threads() {
    LOG_THREAD_INFO("Initiating shutdown of all background threads");

    {
        // Set under the mutex so a waiter cannot miss the flag between check and wait
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        shutdown_requested_.store(true);
    }
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        LOG_THREAD_INFO("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    for (auto& managed : threads_to_join) {
        join_thread(managed);
    }

    LOG_THREAD_INFO("All managed threads have been cleaned up");
}

void ThreadManager::join_thread(ManagedThread& managed) {
    if (!managed.thread.joinable()) {
        return;
    }
    if (managed.thread.get_id() == std::this_thread::get_id()) {
        LOG_THREAD_DEBUG("Detaching " << managed.name << " instead of joining itself");
        managed.thread.detach();
        return;
    }
    try {
        managed.thread.join();
    } catch (const std::system_error& e) {
        LOG_THREAD_ERROR("Exception while joining " << managed.name << ": " << e.what());
    }
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

void ThreadManager::notify_shutdown() {
    shutdown_cv_.notify_all();
}

bool ThreadManager::wait_for_shutdown(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    return shutdown_cv_.wait_for(lock, duration, [this] { return shutdown_requested_.load(); });
}

} // namespace lanmeet
