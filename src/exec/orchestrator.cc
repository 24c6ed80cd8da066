#include <cstdlib>
#include <optional>
#include <runlib/call_in_destructor.hh>
#include <runlib/concat_tostr.hh>
#include <runlib/debug.hh>
#include <runlib/debug_logger.hh>
#include <runlib/exec/orchestrator.hh>
#include <runlib/logger.hh>
#include <runlib/spawner.hh>
#include <unistd.h>

using std::string;
using std::string_view;

namespace runlib::exec {

namespace {

constexpr DebugLogger<false> debuglog;

ProfileRegistry enabled_profiles(const Config& config, const ProfileRegistry& profiles) {
    if (config.enabled_languages) {
        return profiles.restricted_to(*config.enabled_languages);
    }
    return profiles;
}

bool is_executable_in_path(const string& executable) {
    if (executable.find('/') != string::npos) {
        return access(executable.c_str(), X_OK) == 0;
    }
    const char* path_env = getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    string_view path = (path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    while (not path.empty()) {
        auto colon = path.find(':');
        auto dir = path.substr(0, colon);
        path.remove_prefix(colon == string_view::npos ? path.size() : colon + 1);
        if (dir.empty()) {
            dir = ".";
        }
        if (access(concat_tostr(dir, '/', executable).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

Orchestrator::Orchestrator(Config config, const ProfileRegistry& profiles)
: config_{std::move(config)}
, profiles_{enabled_profiles(config_, profiles)}
, workspaces_{config_.workspace_root}
, cleanup_{
      [this](Workspace& ws) { workspaces_.release(ws); },
      {
          .grace_period = config_.cleanup_grace_period,
          .max_attempts = config_.cleanup_max_attempts,
          .retry_delay = config_.cleanup_retry_delay,
      }}
, admission_{config_.max_concurrent_executions} {}

ExecutionResult
Orchestrator::execute(string_view language, string_view source, string_view stdin_data) {
    ExecutionResult res;
    auto fail = [&res](FailureKind kind, string error) {
        res.failure_kind = kind;
        res.error = std::move(error);
        stdlog("Request ", res.id, " (", res.language, "): ", to_string(kind), ": ", res.error);
    };

    try {
        res.language = language;
        res.id = generate_request_id();
        debuglog("Request ", res.id, ": language: ", language, " source: ", source.size(),
                 " bytes, stdin: ", stdin_data.size(), " bytes");

        if (language.empty() or source.empty()) {
            fail(FailureKind::INVALID_REQUEST, "Language and code are required");
            return res;
        }
        if (source.size() + stdin_data.size() > config_.max_request_payload_bytes) {
            fail(
                FailureKind::INVALID_REQUEST,
                concat_tostr(
                    "Request payload exceeds the limit of ", config_.max_request_payload_bytes,
                    " bytes"
                )
            );
            return res;
        }
        auto resolved = profiles_.resolve(language);
        if (resolved.is_err()) {
            fail(FailureKind::UNSUPPORTED_LANGUAGE, "Unsupported language");
            return res;
        }
        const LanguageProfile& profile = *std::move(resolved).unwrap();

        admission_.wait();
        CallInDtor release_admission = [this] { admission_.post(); };

        std::optional<Workspace> ws;
        // The processes are already reaped when this runs
        CallInDtor schedule_cleanup = [&] {
            if (ws) {
                cleanup_.schedule(std::move(*ws));
            }
        };
        ws = workspaces_.allocate(res.id, profile, source, stdin_data);
        compile_and_run(profile, *ws, res);
        // A program exiting with non-zero status is a regular outcome
        if (res.failure_kind and *res.failure_kind != FailureKind::RUNTIME_NON_ZERO_EXIT) {
            stdlog(
                "Request ", res.id, " (", res.language, "): ", to_string(*res.failure_kind),
                ": ", res.error
            );
        }
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        res.output.clear();
        res.output_truncated = false;
        res.error = "Internal error";
        res.error_truncated = false;
        res.exit_description.clear();
        res.failure_kind = FailureKind::INTERNAL_ERROR;
    }
    return res;
}

void Orchestrator::compile_and_run(
    const LanguageProfile& profile, const Workspace& ws, ExecutionResult& res
) {
    auto placeholders = ws.placeholders();
    auto spawn_failed = [&res](const string& program, const Spawner::SpawnError& err) {
        res.failure_kind = FailureKind::SPAWN_FAILED;
        res.error = concat_tostr("Failed to start ", program, ": ", err.description);
    };

    if (profile.compile_command) {
        auto argv = expand_command(*profile.compile_command, placeholders);
        auto compile_res = Spawner::run(
            argv,
            {
                .stdin_file = std::nullopt,
                .time_limit = config_.compile_timeout,
                .max_output_size_in_bytes = config_.max_output_size_in_bytes,
                .working_dir = ws.directory(),
            }
        );
        if (compile_res.is_err()) {
            spawn_failed(argv[0], std::move(compile_res).unwrap_err());
            return;
        }
        auto es = std::move(compile_res).unwrap();
        debuglog("Request ", ws.request_id(), ": compilation ", es.si_description());
        if (not es.exited_normally()) {
            res.failure_kind = FailureKind::COMPILE_FAILED;
            if (not es.stderr_data.empty()) {
                res.error = std::move(es.stderr_data);
                res.error_truncated = es.stderr_truncated;
            } else if (not es.stdout_data.empty()) {
                res.error = std::move(es.stdout_data);
                res.error_truncated = es.stdout_truncated;
            } else if (es.timed_out) {
                res.error = concat_tostr(
                    "Compilation timed out after ", config_.compile_timeout.count(), " ms"
                );
            } else {
                res.error = concat_tostr("Compilation failed: compiler ", es.si_description());
            }
            return;
        }
    }

    auto argv = expand_command(profile.run_command, placeholders);
    auto run_res = Spawner::run(
        argv,
        {
            .stdin_file = ws.stdin_file(),
            .time_limit = config_.run_timeout,
            .max_output_size_in_bytes = config_.max_output_size_in_bytes,
            .working_dir = ws.directory(),
        }
    );
    if (run_res.is_err()) {
        spawn_failed(argv[0], std::move(run_res).unwrap_err());
        return;
    }
    auto es = std::move(run_res).unwrap();
    debuglog("Request ", ws.request_id(), ": program ", es.si_description());

    res.output = std::move(es.stdout_data);
    res.output_truncated = es.stdout_truncated;
    res.exit_description = es.si_description();
    if (es.timed_out) {
        res.failure_kind = FailureKind::RUNTIME_TIMEOUT;
        res.error = concat_tostr("Execution timed out after ", config_.run_timeout.count(), " ms");
        return;
    }

    res.error = std::move(es.stderr_data);
    res.error_truncated = es.stderr_truncated;
    if (not es.exited_normally()) {
        res.failure_kind = FailureKind::RUNTIME_NON_ZERO_EXIT;
    }
}

bool Orchestrator::is_language_available(string_view language_id) const {
    auto resolved = profiles_.resolve(language_id);
    if (resolved.is_err()) {
        return false;
    }
    return is_executable_in_path(std::move(resolved).unwrap()->toolchain_executable);
}

} // namespace runlib::exec
