#include <array>
#include <cerrno>
#include <fcntl.h>
#include <runlib/errmsg.hh>
#include <runlib/file_contents.hh>
#include <runlib/file_descriptor.hh>
#include <runlib/macros/throw.hh>
#include <unistd.h>

using std::string;

size_t read_all(int fd, void* buf, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t rc = read(fd, static_cast<char*>(buf) + pos, count - pos);
        if (rc > 0) {
            pos += rc;
            continue;
        }
        if (rc == 0) {
            errno = 0; // EOF
            return pos;
        }
        if (errno != EINTR) {
            return pos;
        }
    }
    return pos;
}

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t rc = write(fd, static_cast<const char*>(buf) + pos, count - pos);
        if (rc > 0) {
            pos += rc;
        } else if (rc == -1 and errno != EINTR) {
            return pos;
        }
    }
    return pos;
}

string get_file_contents(int fd) {
    string res;
    std::array<char, 1 << 16> buff{};
    for (;;) {
        auto len = read_all(fd, buff.data(), buff.size());
        res.append(buff.data(), len);
        if (len < buff.size()) {
            if (errno != 0) {
                THROW("read()", errmsg());
            }
            return res;
        }
    }
}

string get_file_contents(FilePath file) {
    FileDescriptor fd{file, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open('", file, "')", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(FilePath file, std::string_view data, mode_t mode) {
    FileDescriptor fd{file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW("open('", file, "')", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write('", file, "')", errmsg());
    }
    if (fd.close()) {
        THROW("close('", file, "')", errmsg());
    }
}
