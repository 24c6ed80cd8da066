#pragma once

#include <runlib/concurrent/semaphore.hh>
#include <runlib/exec/cleanup_scheduler.hh>
#include <runlib/exec/config.hh>
#include <runlib/exec/execution_result.hh>
#include <runlib/exec/language_profile.hh>
#include <runlib/exec/workspace.hh>
#include <string_view>

namespace runlib::exec {

class Orchestrator {
    Config config_;
    ProfileRegistry profiles_;
    WorkspaceManager workspaces_;
    CleanupScheduler cleanup_;
    concurrent::Semaphore admission_;

    void compile_and_run(const LanguageProfile& profile, const Workspace& ws, ExecutionResult& res);

public:
    // If config.enabled_languages is set, only these languages from @p profiles are served.
    // Throws std::runtime_error if the workspace root cannot be created.
    explicit Orchestrator(Config config, const ProfileRegistry& profiles = ProfileRegistry{});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Waits for the pending workspace releases
    ~Orchestrator() = default;

    /**
     * @brief Compiles (if the language needs it) and runs @p source with @p stdin_data
     * @details At most config.max_concurrent_executions requests are executed at once, the
     *   rest wait. Every failure is reported through the result. The workspace is always
     *   handed to the cleanup scheduler after the processes exit.
     *   This function is thread-safe.
     */
    ExecutionResult
    execute(std::string_view language, std::string_view source, std::string_view stdin_data);

    ExecutionResult execute(const ExecutionRequest& req) {
        return execute(req.language, req.source, req.stdin_data);
    }

    // Blocks until every workspace scheduled for removal is removed
    void wait_for_pending_cleanups() { cleanup_.wait_until_idle(); }

    // Returns true iff @p language_id is served and its toolchain is found in PATH
    [[nodiscard]] bool is_language_available(std::string_view language_id) const;

    [[nodiscard]] const ProfileRegistry& profiles() const noexcept { return profiles_; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    // Number of workspaces that could not be removed
    [[nodiscard]] size_t failed_cleanups() const noexcept { return cleanup_.given_up_count(); }
};

} // namespace runlib::exec
