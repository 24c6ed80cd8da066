#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <runlib/call_in_destructor.hh>
#include <runlib/debug.hh>
#include <runlib/errmsg.hh>
#include <runlib/exec/workspace.hh>
#include <runlib/file_contents.hh>
#include <runlib/file_descriptor.hh>
#include <runlib/file_manip.hh>
#include <runlib/macros/throw.hh>
#include <runlib/random.hh>
#include <runlib/string_transform.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr size_t REQUEST_ID_BYTES = 16;

// Unlinks @p path, a missing file is not an error
void unlink_if_exists(const string& path) {
    if (unlink(path.c_str()) and errno != ENOENT) {
        THROW("unlink('", path, "')", errmsg());
    }
}

// Returns names of regular files and symlinks directly inside @p dir, empty if @p dir is
// missing
vector<string> list_files(const string& dir) {
    vector<string> res;
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
        if (errno == ENOENT) {
            return res;
        }
        THROW("opendir('", dir, "')", errmsg());
    }
    CallInDtor close_dir = [d] { (void)closedir(d); };

    for (;;) {
        errno = 0;
        dirent* file = readdir(d);
        if (file == nullptr) {
            if (errno) {
                THROW("readdir('", dir, "')", errmsg());
            }
            return res;
        }
        if (file->d_type != DT_DIR) {
            res.emplace_back(file->d_name);
        }
    }
}

} // namespace

namespace runlib::exec {

Placeholders Workspace::placeholders() const {
    return {
        .source = source_file_,
        .executable = executable_file_,
        .workdir = directory_.substr(0, directory_.size() - 1),
        .entry_point = entry_point_,
    };
}

string generate_request_id() { return to_hex(random_bytes(REQUEST_ID_BYTES)); }

WorkspaceManager::WorkspaceManager(string root)
: root_{std::move(root)} {
    if (root_.empty() or root_.front() != '/') {
        THROW("Workspace root has to be an absolute path: ", root_);
    }
    if (root_.back() != '/') {
        root_ += '/';
    }
    if (mkdir_r(root_)) {
        THROW("mkdir_r('", root_, "')", errmsg());
    }
}

Workspace WorkspaceManager::allocate(
    const string& request_id, const LanguageProfile& profile, string_view source,
    string_view stdin_data
) {
    if (request_id.empty() or request_id.find('/') != string::npos or request_id == "." or
        request_id == "..")
    {
        THROW("Invalid request id: ", request_id);
    }

    Workspace ws;
    ws.request_id_ = request_id;
    ws.directory_ = concat_tostr(root_, request_id, '/');
    ws.secondary_artifact_suffixes_ = profile.secondary_artifact_suffixes;
    if (mkdir(ws.directory_.c_str(), 0700)) {
        THROW("mkdir('", ws.directory_, "')", errmsg());
    }
    ws.created_paths_.emplace_back(ws.directory_);

    CallInDtor remove_on_failure = [&] {
        try {
            release(ws);
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
        }
    };

    if (profile.artifact_naming == ArtifactNaming::DERIVED_FROM_SOURCE) {
        ws.entry_point_ = extract_entry_point(source, profile.default_entry_point);
        ws.source_file_ = concat_tostr(ws.directory_, ws.entry_point_, profile.source_extension);
    } else {
        ws.entry_point_ = profile.default_entry_point;
        ws.source_file_ = concat_tostr(ws.directory_, "source", profile.source_extension);
    }
    ws.executable_file_ = concat_tostr(ws.directory_, "program");

    ws.created_paths_.emplace_back(ws.source_file_);
    put_file_contents(ws.source_file_, source, 0600);

    if (not stdin_data.empty()) {
        ws.stdin_file_ = concat_tostr(ws.directory_, "stdin");
        ws.created_paths_.emplace_back(*ws.stdin_file_);
        put_file_contents(*ws.stdin_file_, stdin_data, 0600);
    }

    remove_on_failure.cancel();
    return ws;
}

void WorkspaceManager::release(Workspace& ws) {
    if (ws.released_ or ws.directory_.empty()) {
        return;
    }
    // Never touch anything outside of the request directory
    if (not string_view{ws.directory_}.starts_with(root_) or
        ws.directory_ != concat_tostr(root_, ws.request_id_, '/'))
    {
        THROW("Workspace directory ", ws.directory_, " is not inside ", root_);
    }

    // Recorded files, the directory itself goes last
    for (const auto& path : ws.created_paths_) {
        if (path != ws.directory_) {
            unlink_if_exists(path);
        }
    }

    // Compiler leftovers
    unlink_if_exists(ws.executable_file_);
    for (const auto& name : list_files(ws.directory_)) {
        for (const auto& suffix : ws.secondary_artifact_suffixes_) {
            if (string_view{name}.ends_with(suffix)) {
                unlink_if_exists(ws.directory_ + name);
                break;
            }
        }
    }

    // Anything the program created
    if (remove_r(ws.directory_) and errno != ENOENT) {
        THROW("remove_r('", ws.directory_, "')", errmsg());
    }
    ws.released_ = true;
}

} // namespace runlib::exec
