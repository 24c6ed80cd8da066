#include <runlib/exec/language_profile.hh>
#include <runlib/macros/throw.hh>
#include <runlib/string_transform.hh>
#include <set>

using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr bool is_space(char c) noexcept {
    return (c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f');
}

constexpr bool is_identifier_char(char c) noexcept {
    return ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '_' or c == '$');
}

// Skips at least one white-space, returns std::string_view::npos if there is none
size_t skip_spaces(string_view str, size_t pos) noexcept {
    size_t end = pos;
    while (end < str.size() and is_space(str[end])) {
        ++end;
    }
    return end == pos ? string_view::npos : end;
}

} // namespace

namespace runlib::exec {

vector<string> expand_command(const vector<string>& command_template, const Placeholders& ph) {
    const std::pair<string_view, const string&> substitutions[] = {
        {"{source}", ph.source},
        {"{executable}", ph.executable},
        {"{workdir}", ph.workdir},
        {"{entry_point}", ph.entry_point},
    };

    vector<string> res;
    res.reserve(command_template.size());
    for (const auto& arg : command_template) {
        string expanded;
        for (size_t i = 0; i < arg.size();) {
            bool substituted = false;
            for (const auto& [placeholder, value] : substitutions) {
                if (string_view{arg}.substr(i).starts_with(placeholder)) {
                    expanded += value;
                    i += placeholder.size();
                    substituted = true;
                    break;
                }
            }
            if (not substituted) {
                expanded += arg[i++];
            }
        }
        res.emplace_back(std::move(expanded));
    }
    return res;
}

string extract_entry_point(string_view source, string_view fallback) {
    for (size_t pos = source.find("public"); pos != string_view::npos;
         pos = source.find("public", pos + 1))
    {
        size_t p = skip_spaces(source, pos + 6);
        if (p == string_view::npos or source.substr(p, 5) != "class") {
            continue;
        }
        p = skip_spaces(source, p + 5);
        if (p == string_view::npos) {
            continue;
        }
        size_t end = p;
        while (end < source.size() and is_identifier_char(source[end])) {
            ++end;
        }
        if (end > p) {
            return string{source.substr(p, end - p)};
        }
    }
    return string{fallback};
}

vector<LanguageProfile> builtin_profiles() {
    vector<LanguageProfile> res;
    res.push_back({
        .id = "c",
        .source_extension = ".c",
        .compile_command =
            vector<string>{"gcc", "-O2", "-std=c11", "{source}", "-o", "{executable}", "-lm"},
        .run_command = {"{executable}"},
        .artifact_naming = ArtifactNaming::REQUEST_SCOPED,
        .default_entry_point = "main",
        .secondary_artifact_suffixes = {},
        .toolchain_executable = "gcc",
    });
    res.push_back({
        .id = "cpp",
        .source_extension = ".cpp",
        .compile_command =
            vector<string>{"g++", "-O2", "-std=c++17", "{source}", "-o", "{executable}"},
        .run_command = {"{executable}"},
        .artifact_naming = ArtifactNaming::REQUEST_SCOPED,
        .default_entry_point = "main",
        .secondary_artifact_suffixes = {},
        .toolchain_executable = "g++",
    });
    res.push_back({
        .id = "python",
        .source_extension = ".py",
        .compile_command = std::nullopt,
        .run_command = {"python3", "{source}"},
        .artifact_naming = ArtifactNaming::REQUEST_SCOPED,
        .default_entry_point = "__main__",
        .secondary_artifact_suffixes = {".pyc"},
        .toolchain_executable = "python3",
    });
    res.push_back({
        .id = "bash",
        .source_extension = ".sh",
        .compile_command = std::nullopt,
        .run_command = {"bash", "{source}"},
        .artifact_naming = ArtifactNaming::REQUEST_SCOPED,
        .default_entry_point = "main",
        .secondary_artifact_suffixes = {},
        .toolchain_executable = "bash",
    });
    res.push_back({
        .id = "java",
        .source_extension = ".java",
        .compile_command = vector<string>{"javac", "-d", "{workdir}", "{source}"},
        .run_command = {"java", "-cp", "{workdir}", "{entry_point}"},
        .artifact_naming = ArtifactNaming::DERIVED_FROM_SOURCE,
        .default_entry_point = "Main",
        .secondary_artifact_suffixes = {".class"},
        .toolchain_executable = "javac",
    });
    return res;
}

ProfileRegistry::ProfileRegistry(vector<LanguageProfile> profiles)
: profiles_{std::move(profiles)} {
    std::set<string, std::less<>> ids;
    for (auto& profile : profiles_) {
        profile.id = to_lower(std::move(profile.id));
        if (profile.id.empty()) {
            THROW("Language profile with an empty id");
        }
        if (profile.run_command.empty()) {
            THROW("Language profile ", profile.id, " has an empty run command");
        }
        if (profile.compile_command and profile.compile_command->empty()) {
            THROW("Language profile ", profile.id, " has an empty compile command");
        }
        if (not ids.emplace(profile.id).second) {
            THROW("Duplicated language profile: ", profile.id);
        }
    }
}

Result<const LanguageProfile*, UnsupportedLanguage>
ProfileRegistry::resolve(string_view language_id) const {
    auto id = to_lower(string{language_id});
    for (const auto& profile : profiles_) {
        if (profile.id == id) {
            return Ok{&profile};
        }
    }
    return Err{UnsupportedLanguage{.language_id = string{language_id}}};
}

ProfileRegistry ProfileRegistry::restricted_to(const vector<string>& ids) const {
    vector<LanguageProfile> selected;
    for (const auto& id : ids) {
        auto res = resolve(id);
        if (res.is_err()) {
            THROW("Unknown language: ", id);
        }
        selected.emplace_back(*std::move(res).unwrap());
    }
    return ProfileRegistry{std::move(selected)};
}

} // namespace runlib::exec
