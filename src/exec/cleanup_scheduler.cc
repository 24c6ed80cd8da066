#include <runlib/debug.hh>
#include <runlib/exec/cleanup_scheduler.hh>
#include <runlib/logger.hh>
#include <runlib/macros/throw.hh>

namespace runlib::exec {

CleanupScheduler::CleanupScheduler(ReleaseFunc release, Options opts)
: release_{std::move(release)}
, opts_{opts} {
    if (opts_.max_attempts == 0) {
        THROW("CleanupScheduler: max_attempts has to be positive");
    }
    worker_ = std::thread{[this] { work(); }};
}

CleanupScheduler::~CleanupScheduler() {
    {
        std::lock_guard lock{mtx_};
        shutting_down_ = true;
    }
    queue_.signal_no_more_elems();
    worker_.join();
}

void CleanupScheduler::release_with_retries(Workspace& ws) {
    for (unsigned attempt = 1;; ++attempt) {
        try {
            release_(ws);
            return;
        } catch (const std::exception& e) {
            if (attempt >= opts_.max_attempts) {
                errlog(
                    "Giving up removing workspace ", ws.request_id(), " after ", attempt,
                    " attempts: ", e.what()
                );
                ++given_up_;
                return;
            }
            errlog(
                "Failed to remove workspace ", ws.request_id(), " (attempt ", attempt, " of ",
                opts_.max_attempts, "): ", e.what()
            );
        }
        std::this_thread::sleep_for(opts_.retry_delay);
    }
}

void CleanupScheduler::work() {
    for (;;) {
        std::optional<Job> job;
        try {
            job = queue_.pop_opt();
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
            continue;
        }
        if (not job) {
            return; // No more jobs
        }

        std::this_thread::sleep_until(job->not_before);
        try {
            release_with_retries(job->ws);
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
        }

        {
            std::lock_guard lock{mtx_};
            --pending_;
        }
        idle_cv_.notify_all();
    }
}

void CleanupScheduler::schedule(Workspace ws) noexcept {
    try {
        auto job = Job{
            .ws = std::move(ws),
            .not_before = std::chrono::steady_clock::now() + opts_.grace_period,
        };
        {
            std::lock_guard lock{mtx_};
            if (not shutting_down_) {
                ++pending_;
                try {
                    queue_.push(std::move(job));
                    return;
                } catch (const std::exception& e) {
                    --pending_;
                    ERRLOG_CATCH(e);
                }
            }
        }
        // Synchronous fallback, the workspace is never left behind
        release_with_retries(job.ws);
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
    }
}

void CleanupScheduler::wait_until_idle() {
    std::unique_lock lock{mtx_};
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

} // namespace runlib::exec
