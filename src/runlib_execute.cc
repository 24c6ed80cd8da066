#include <cstdio>
#include <optional>
#include <runlib/config_file.hh>
#include <runlib/exec/config.hh>
#include <runlib/exec/orchestrator.hh>
#include <runlib/file_contents.hh>
#include <runlib/logger.hh>
#include <string>
#include <string_view>
#include <vector>

using runlib::exec::Config;
using runlib::exec::ExecutionResult;
using runlib::exec::Orchestrator;
using std::string;
using std::string_view;

namespace {

void print_usage(const char* program) {
    errlog.label(false);
    errlog(
        "Usage: ", program, " [-c <config file>] <language> <source file> [stdin file]\n",
        "       ", program, " [-c <config file>] --health\n",
        "Runs the program and prints the result as `name: value` lines"
    );
}

void print_var(string_view name, string_view value) {
    auto line = concat_tostr(name, ": ", ConfigFile::escape_string(value), '\n');
    (void)fwrite(line.data(), 1, line.size(), stdout);
}

void print_result(const ExecutionResult& res) {
    print_var("id", res.id);
    print_var("language", res.language);
    print_var("failure_kind", res.failure_kind ? to_string(*res.failure_kind) : "");
    print_var("exit_description", res.exit_description);
    print_var("output", res.output);
    print_var("output_truncated", res.output_truncated ? "true" : "false");
    print_var("error", res.error);
    print_var("error_truncated", res.error_truncated ? "true" : "false");
}

} // namespace

int main(int argc, char** argv) {
    std::optional<string> config_file;
    std::vector<string> args;
    bool health = false;
    for (int i = 1; i < argc; ++i) {
        string_view arg = argv[i];
        if (arg == "-c" and i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--health") {
            health = true;
        } else if (arg == "-h" or arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.emplace_back(arg);
        }
    }
    if (health ? not args.empty() : (args.size() < 2 or args.size() > 3)) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        auto config = config_file ? Config::load_from_file(*config_file) : Config{};
        if (config.log_file) {
            stdlog.open(*config.log_file);
            errlog.open(*config.log_file);
        }

        Orchestrator orchestrator{std::move(config)};
        if (health) {
            for (const auto& profile : orchestrator.profiles().profiles()) {
                print_var(
                    profile.id, orchestrator.is_language_available(profile.id) ? "ok" : "missing"
                );
            }
            return 0;
        }

        auto source = get_file_contents(args[1]);
        auto stdin_data = args.size() == 3 ? get_file_contents(args[2]) : string{};
        auto res = orchestrator.execute(args[0], source, stdin_data);
        print_result(res);
        return res.failure_kind ? 1 : 0;
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return 1;
    }
}
