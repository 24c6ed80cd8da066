#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <runlib/file_path.hh>
#include <string>
#include <vector>

namespace runlib::exec {

struct Config {
    std::string workspace_root = "/tmp/runlib";
    std::chrono::milliseconds compile_timeout{10'000};
    std::chrono::milliseconds run_timeout{5'000};
    size_t max_output_size_in_bytes = 1 << 20;
    size_t max_request_payload_bytes = 1 << 20;
    unsigned max_concurrent_executions = 8;
    std::chrono::milliseconds cleanup_grace_period{0};
    unsigned cleanup_max_attempts = 3;
    std::chrono::milliseconds cleanup_retry_delay{100};
    std::optional<std::vector<std::string>> enabled_languages; // std::nullopt - all builtin
    std::optional<std::string> log_file; // std::nullopt - stderr
    std::optional<uint16_t> port;

    // Variables missing in the config keep their default values. Throws std::runtime_error
    // (ConfigFile::ParseError on syntax errors) if the config is invalid.
    static Config load_from_string(std::string str);

    // Like load_from_string(), but reads the config from @p path
    static Config load_from_file(FilePath path);
};

} // namespace runlib::exec
