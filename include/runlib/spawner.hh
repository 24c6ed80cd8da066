#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <runlib/result.hh>
#include <string>
#include <vector>

class Spawner {
public:
    /// Describes exit status of the spawned process
    struct Si {
        int code; // siginfo_t::si_code from waitid() of the spawned process
        int status; // siginfo_t::si_status from waitid() of the spawned process

        [[nodiscard]] std::string description() const;

        [[nodiscard]] bool operator==(const Si& other) const noexcept {
            return code == other.code and status == other.status;
        }

        [[nodiscard]] bool operator!=(const Si& other) const noexcept {
            return not(*this == other);
        }
    };

    struct ExitStat {
        Si si{};
        std::chrono::nanoseconds runtime{0};
        bool timed_out = false;
        std::string stdout_data;
        std::string stderr_data;
        bool stdout_truncated = false;
        bool stderr_truncated = false;

        // Returns true iff the process exited by itself with status 0
        [[nodiscard]] bool exited_normally() const noexcept;

        [[nodiscard]] std::string si_description() const { return si.description(); }
    };

    // The process could not be started, e.g. the executable does not exist
    struct SpawnError {
        std::string description;
    };

    struct Options {
        std::optional<std::string> stdin_file; // std::nullopt - /dev/null is used
        std::optional<std::chrono::nanoseconds> time_limit; // wall clock
        size_t max_output_size_in_bytes = 1 << 20; // applied to stdout and stderr separately
        std::string working_dir; // empty - do not change working directory
    };

    /**
     * @brief Runs argv[0] (resolved via execvp(), no shell is involved) with arguments @p argv
     * @details The process becomes a leader of a new process group. On timeout and after the
     *   process exits the whole process group is killed, so no descendant outlives the call.
     *   Stdout and stderr are captured, bytes above opts.max_output_size_in_bytes are read
     *   and discarded. This function is thread-safe.
     *
     * @return ExitStat or SpawnError if the process failed before executing argv[0] or
     *   could not be created at all (e.g. fork() failed with EAGAIN or pipe2() with EMFILE)
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall in the calling process fails
     */
    static Result<ExitStat, SpawnError>
    run(const std::vector<std::string>& argv, const Options& opts);
};
