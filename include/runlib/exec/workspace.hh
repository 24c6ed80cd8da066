#pragma once

#include <optional>
#include <runlib/exec/language_profile.hh>
#include <string>
#include <string_view>
#include <vector>

namespace runlib::exec {

// Filesystem artifacts of exactly one request, all of them inside
// <workspace root>/<request id>/
class Workspace {
    std::string request_id_;
    std::string directory_; // with trailing '/'
    std::string source_file_;
    std::string executable_file_;
    std::optional<std::string> stdin_file_;
    std::string entry_point_;
    std::vector<std::string> created_paths_;
    std::vector<std::string> secondary_artifact_suffixes_;
    bool released_ = false;

    Workspace() = default;

    friend class WorkspaceManager;

public:
    Workspace(const Workspace&) = delete;
    Workspace(Workspace&&) noexcept = default;
    Workspace& operator=(const Workspace&) = delete;
    Workspace& operator=(Workspace&&) noexcept = default;
    ~Workspace() = default;

    [[nodiscard]] const std::string& request_id() const noexcept { return request_id_; }

    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }

    [[nodiscard]] const std::string& source_file() const noexcept { return source_file_; }

    // Path at which the compiled program is expected, it exists only after compilation
    [[nodiscard]] const std::string& executable_file() const noexcept {
        return executable_file_;
    }

    [[nodiscard]] const std::optional<std::string>& stdin_file() const noexcept {
        return stdin_file_;
    }

    [[nodiscard]] const std::string& entry_point() const noexcept { return entry_point_; }

    [[nodiscard]] const std::vector<std::string>& created_paths() const noexcept {
        return created_paths_;
    }

    [[nodiscard]] bool is_released() const noexcept { return released_; }

    [[nodiscard]] Placeholders placeholders() const;
};

// Returns 32 hex digits generated from 128 random bits
std::string generate_request_id();

class WorkspaceManager {
    std::string root_; // absolute, with trailing '/'

public:
    // Creates @p root (like mkdir -p) if it does not exist
    explicit WorkspaceManager(std::string root);

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    /**
     * @brief Creates directory <root>/<request_id>/ and stages the source and stdin
     * @details The source is written to source<ext> or for profiles with derived artifact
     *   naming to <entry point><ext>. Stdin file is created only if @p stdin_data is
     *   non-empty. If anything fails, everything created so far is removed.
     *
     * @errors Throws std::runtime_error on error, in particular if the directory already
     *   exists
     */
    Workspace allocate(
        const std::string& request_id,
        const LanguageProfile& profile,
        std::string_view source,
        std::string_view stdin_data
    );

    /**
     * @brief Removes every artifact of @p ws and its directory
     * @details Recorded paths are unlinked first, then compiler leftovers (secondary
     *   artifact suffixes and the executable) are swept, then whatever remains in the
     *   directory is removed together with the directory. Missing files are not an error,
     *   so calling it again is a no-op.
     *
     * @errors Throws std::runtime_error describing the first failure
     */
    void release(Workspace& ws);
};

} // namespace runlib::exec
