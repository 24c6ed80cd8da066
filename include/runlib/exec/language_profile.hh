#pragma once

#include <optional>
#include <runlib/result.hh>
#include <string>
#include <string_view>
#include <vector>

namespace runlib::exec {

enum class ArtifactNaming {
    REQUEST_SCOPED, // source is staged as source<ext>
    DERIVED_FROM_SOURCE, // source is staged as <entry point><ext>, e.g. Main.java
};

// Static description of how to build and run programs in one language. Commands are argv
// templates in which the following placeholders are substituted:
//   {source} - absolute path of the staged source file
//   {executable} - absolute path of the compiled artifact
//   {workdir} - absolute path of the request directory
//   {entry_point} - entry point name derived from the source (or the default one)
struct LanguageProfile {
    std::string id; // lower-case
    std::string source_extension; // with the leading dot
    std::optional<std::vector<std::string>> compile_command;
    std::vector<std::string> run_command;
    ArtifactNaming artifact_naming = ArtifactNaming::REQUEST_SCOPED;
    std::string default_entry_point;
    std::vector<std::string> secondary_artifact_suffixes; // left by the compiler, e.g. ".class"
    std::string toolchain_executable; // checked by the availability probe

    [[nodiscard]] bool has_compile_step() const noexcept { return compile_command.has_value(); }
};

struct Placeholders {
    std::string source;
    std::string executable;
    std::string workdir;
    std::string entry_point;
};

// Substitutes placeholders in every argument of @p command_template
std::vector<std::string>
expand_command(const std::vector<std::string>& command_template, const Placeholders& ph);

// Returns the identifier following the first "public class" in @p source or @p fallback if
// there is none. Only [A-Za-z0-9_$] identifiers are accepted.
std::string extract_entry_point(std::string_view source, std::string_view fallback);

// c, cpp, python, bash and java
std::vector<LanguageProfile> builtin_profiles();

struct UnsupportedLanguage {
    std::string language_id;
};

class ProfileRegistry {
    std::vector<LanguageProfile> profiles_;

public:
    // Throws std::runtime_error on duplicated or empty ids
    explicit ProfileRegistry(std::vector<LanguageProfile> profiles = builtin_profiles());

    // Case-insensitive lookup, the returned pointer is valid as long as *this
    [[nodiscard]] Result<const LanguageProfile*, UnsupportedLanguage>
    resolve(std::string_view language_id) const;

    [[nodiscard]] const std::vector<LanguageProfile>& profiles() const noexcept {
        return profiles_;
    }

    // Returns a registry containing only the profiles with ids from @p ids, throws
    // std::runtime_error if any id is unknown
    [[nodiscard]] ProfileRegistry restricted_to(const std::vector<std::string>& ids) const;
};

} // namespace runlib::exec
