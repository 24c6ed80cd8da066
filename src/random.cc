#include <cerrno>
#include <runlib/errmsg.hh>
#include <runlib/macros/throw.hh>
#include <runlib/random.hh>
#include <sys/random.h>

void fill_randomly(void* dest, size_t bytes) {
    while (bytes > 0) {
        ssize_t len = getrandom(dest, bytes, 0);
        if (len >= 0) {
            bytes -= len;
            dest = static_cast<char*>(dest) + len;
        } else if (errno != EINTR) {
            THROW("getrandom()", errmsg());
        }
    }
}
