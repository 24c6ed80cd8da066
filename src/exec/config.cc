#include <climits>
#include <runlib/config_file.hh>
#include <runlib/exec/config.hh>
#include <runlib/file_contents.hh>
#include <runlib/macros/throw.hh>

using std::string;

namespace runlib::exec {

namespace {

// About 24.8 days
constexpr uint64_t MAX_MILLISECONDS = INT_MAX;

template <class T>
void load_positive_number(const ConfigFile& cf, const char* name, T& var) {
    const auto& cv = cf[name];
    if (not cv.is_set()) {
        return;
    }
    if (cv.is_array()) {
        THROW(name, ": expected a number, got an array");
    }
    auto opt = cv.as<T>();
    if (not opt) {
        THROW(name, ": invalid number: ", cv.as_string());
    }
    if (*opt == 0) {
        THROW(name, ": has to be greater than 0");
    }
    var = *opt;
}

void load_milliseconds(
    const ConfigFile& cf, const char* name, std::chrono::milliseconds& var, bool allow_zero
) {
    const auto& cv = cf[name];
    if (not cv.is_set()) {
        return;
    }
    auto opt = cv.as<uint64_t>();
    if (cv.is_array() or not opt) {
        THROW(name, ": invalid number of milliseconds: ", cv.as_string());
    }
    if (*opt == 0 and not allow_zero) {
        THROW(name, ": has to be greater than 0");
    }
    if (*opt > MAX_MILLISECONDS) {
        THROW(name, ": cannot be greater than ", MAX_MILLISECONDS);
    }
    var = std::chrono::milliseconds{*opt};
}

std::optional<string> load_string(const ConfigFile& cf, const char* name) {
    const auto& cv = cf[name];
    if (not cv.is_set()) {
        return std::nullopt;
    }
    if (cv.is_array()) {
        THROW(name, ": expected a string, got an array");
    }
    return cv.as_string();
}

} // namespace

Config Config::load_from_string(string str) {
    ConfigFile cf;
    cf.add_vars(
        "workspace_root", "compile_timeout_ms", "run_timeout_ms", "max_output_size_in_bytes",
        "max_request_payload_bytes", "max_concurrent_executions", "cleanup_grace_period_ms",
        "cleanup_max_attempts", "cleanup_retry_delay_ms", "enabled_languages", "log_file", "port"
    );
    cf.load_config_from_string(std::move(str));

    Config conf;
    if (auto root = load_string(cf, "workspace_root")) {
        if (root->empty() or root->front() != '/') {
            THROW("workspace_root: has to be an absolute path, got: ", *root);
        }
        conf.workspace_root = std::move(*root);
    }
    load_milliseconds(cf, "compile_timeout_ms", conf.compile_timeout, false);
    load_milliseconds(cf, "run_timeout_ms", conf.run_timeout, false);
    load_positive_number(cf, "max_output_size_in_bytes", conf.max_output_size_in_bytes);
    load_positive_number(cf, "max_request_payload_bytes", conf.max_request_payload_bytes);
    load_positive_number(cf, "max_concurrent_executions", conf.max_concurrent_executions);
    load_milliseconds(cf, "cleanup_grace_period_ms", conf.cleanup_grace_period, true);
    load_positive_number(cf, "cleanup_max_attempts", conf.cleanup_max_attempts);
    load_milliseconds(cf, "cleanup_retry_delay_ms", conf.cleanup_retry_delay, true);

    if (const auto& cv = cf["enabled_languages"]; cv.is_set()) {
        if (not cv.is_array()) {
            THROW("enabled_languages: expected an array, e.g. [c, python]");
        }
        if (cv.as_array().empty()) {
            THROW("enabled_languages: at least one language has to be enabled");
        }
        conf.enabled_languages = cv.as_array();
    }

    conf.log_file = load_string(cf, "log_file");
    if (conf.log_file and conf.log_file->empty()) {
        conf.log_file = std::nullopt;
    }

    if (cf["port"].is_set()) {
        uint16_t port = 0;
        load_positive_number(cf, "port", port);
        conf.port = port;
    }

    return conf;
}

Config Config::load_from_file(FilePath path) {
    try {
        return load_from_string(get_file_contents(path));
    } catch (const std::exception& e) {
        THROW("Failed to load config ", path, ": ", e.what());
    }
}

} // namespace runlib::exec
