#include <cstdlib>
#include <linux/limits.h>
#include <runlib/errmsg.hh>
#include <runlib/file_manip.hh>
#include <runlib/logger.hh>
#include <runlib/macros/throw.hh>
#include <runlib/temporary_directory.hh>
#include <string_view>
#include <unistd.h>

TemporaryDirectory::TemporaryDirectory(FilePath templ) {
    std::string name = templ.to_str();
    while (name.size() > 1 and name.back() == '/') {
        name.pop_back();
    }
    if (not std::string_view{name}.ends_with("XXXXXX")) {
        THROW("Invalid temporary directory template: ", name);
    }

    // Create directory with permissions (mode: 0700/rwx------)
    if (mkdtemp(name.data()) == nullptr) {
        THROW("Cannot create temporary directory", errmsg());
    }

    if (name.front() == '/') {
        path_ = std::move(name);
    } else {
        char cwd[PATH_MAX];
        if (getcwd(cwd, sizeof(cwd)) == nullptr) {
            int errnum = errno;
            (void)remove_r(name);
            THROW("getcwd()", errmsg(errnum));
        }
        path_ = concat_tostr(cwd, '/', name);
    }
    path_ += '/';
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (exists() and remove_r(path_) == -1) {
        THROW("remove_r() failed", errmsg());
    }

    path_ = std::move(td.path_);
    td.path_.clear();
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_) == -1) {
        errlog("Error: remove_r()", errmsg()); // We cannot throw from the destructor
    }
}
