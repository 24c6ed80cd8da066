#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <runlib/concurrent/bounded_queue.hh>
#include <runlib/exec/workspace.hh>
#include <thread>

namespace runlib::exec {

// Releases workspaces on a background thread. Failed releases are retried and logged, they
// never reach the caller.
class CleanupScheduler {
public:
    using ReleaseFunc = std::function<void(Workspace&)>;

    struct Options {
        std::chrono::milliseconds grace_period{0}; // delay before the first attempt
        unsigned max_attempts = 3;
        std::chrono::milliseconds retry_delay{100};
    };

private:
    struct Job {
        Workspace ws;
        std::chrono::steady_clock::time_point not_before;
    };

    ReleaseFunc release_;
    Options opts_;
    concurrent::BoundedQueue<Job> queue_;
    std::mutex mtx_;
    std::condition_variable idle_cv_;
    size_t pending_ = 0; // scheduled and not finished yet
    bool shutting_down_ = false;
    std::atomic<size_t> given_up_{0};
    std::thread worker_;

    void work();

    void release_with_retries(Workspace& ws);

public:
    // Throws std::runtime_error if opts.max_attempts == 0
    CleanupScheduler(ReleaseFunc release, Options opts);

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler(CleanupScheduler&&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(CleanupScheduler&&) = delete;

    // Performs all pending releases before returning
    ~CleanupScheduler();

    // Call only after the processes using @p ws have been reaped. If the background thread
    // cannot take the job, it is released synchronously.
    void schedule(Workspace ws) noexcept;

    // Blocks until every scheduled release has finished
    void wait_until_idle();

    // Number of workspaces whose release failed max_attempts times
    [[nodiscard]] size_t given_up_count() const noexcept { return given_up_.load(); }
};

} // namespace runlib::exec
