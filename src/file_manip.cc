#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <linux/limits.h>
#include <runlib/file_manip.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

int mkdir_r(string path, mode_t mode) noexcept {
    if (path.size() >= PATH_MAX) {
        errno = ENAMETOOLONG;
        return -1;
    }

    // Add ending slash (if not exists)
    if (path.empty() or path.back() != '/') {
        path += '/';
    }

    size_t end = 1; // If there is a leading slash, it will be omitted
    while (end < path.size()) {
        while (path[end] != '/') {
            ++end;
        }

        path[end] = '\0'; // Separate subpath
        if (mkdir(path.data(), mode) == -1 and errno != EEXIST) {
            return -1;
        }

        path[end++] = '/';
    }

    return 0;
}

int remove_rat(int dirfd, FilePath path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        (void)close(fd);
        return unlinkat(dirfd, path, AT_REMOVEDIR);
    }

    int ec = 0;
    for (;;) {
        errno = 0;
        dirent* file = readdir(dir);
        if (file == nullptr) {
            ec = errno;
            break;
        }
        if (file->d_name[0] == '.' and
            (file->d_name[1] == '\0' or (file->d_name[1] == '.' and file->d_name[2] == '\0')))
        {
            continue;
        }
        if (remove_rat(fd, file->d_name)) {
            ec = errno;
            break;
        }
    }

    (void)closedir(dir);

    if (ec) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

int remove_r(FilePath path) noexcept { return remove_rat(AT_FDCWD, path); }
