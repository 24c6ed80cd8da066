#include <ctime>
#include <exception>
#include <runlib/errmsg.hh>
#include <runlib/logger.hh>
#include <runlib/macros/throw.hh>

using std::string;

namespace {

// Returns local time in format YYYY-MM-DD HH:MM:SS
string local_datetime() {
    time_t now = time(nullptr);
    tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        THROW("localtime_r()", errmsg());
    }
    char buff[32];
    auto len = strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &local);
    if (len == 0) {
        THROW("strftime() failed");
    }
    return string(buff, len);
}

} // namespace

Logger::Logger(FilePath filename)
: f_(fopen(filename, "ae"))
, opened_(true) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
}

void Logger::open(FilePath filename) {
    FILE* f = fopen(filename, "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush_impl(const char* newline_or_empty_str) noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            try {
                (void)fprintf(
                    logger_.f_,
                    "[ %s ] %.*s%s",
                    local_datetime().c_str(),
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            } catch (const std::exception&) {
                (void)fprintf(
                    logger_.f_,
                    "[ unknown time ] %.*s%s",
                    static_cast<int>(buff_.size()),
                    buff_.data(),
                    newline_or_empty_str
                );
            }
        } else {
            (void)fprintf(
                logger_.f_,
                "%.*s%s",
                static_cast<int>(buff_.size()),
                buff_.data(),
                newline_or_empty_str
            );
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
