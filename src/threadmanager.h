#pragma once

#include "logger.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanmeet {

/**
 * ThreadManager owns the background tasks of a session (accept loop, one
 * receive loop per connection, one task per outgoing file) and coordinates
 * their shutdown.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a managed thread running `body`.
     * Threads that have already finished are joined first, so a long-running
     * session only tracks the threads that are still alive.
     * @param body Work to run on the new thread
     * @param name Descriptive name for logging purposes
     * @return false if shutdown has been requested; the thread is not started
     */
    bool add_managed_thread(std::function<void()> body, const std::string& name);

    /**
     * Join every managed thread whose body has returned
     */
    void cleanup_finished_threads();

    /**
     * Signal all threads to shutdown and notify waiting threads
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish.
     * When called from one of the managed threads, that thread is detached
     * rather than joined.
     */
    void join_all_active_threads();

    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Condition variable for coordinating thread shutdown.
     * Threads wait on it and check their running flags.
     */
    std::condition_variable shutdown_cv_;
    std::mutex shutdown_mutex_;

    void notify_shutdown();

    /**
     * Sleep for up to `duration`, waking early on shutdown
     * @return true if shutdown was requested
     */
    bool wait_for_shutdown(std::chrono::milliseconds duration);

private:
    struct ManagedThread {
        std::thread thread;
        std::string name;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static void join_thread(ManagedThread& managed);

    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace lanmeet
