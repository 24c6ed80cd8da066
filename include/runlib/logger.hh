#pragma once

#include <atomic>
#include <cstdio>
#include <runlib/concat_tostr.hh>
#include <runlib/file_path.hh>
#include <string>
#include <utility>

class Logger {
private:
    FILE* f_;
    std::atomic<bool> opened_{false}, label_{true};

    void close() noexcept {
        if (opened_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    // Lock the file
    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }

        flockfile(f_);
        return true;
    }

    // Unlock the file
    void unlock() noexcept { funlockfile(f_); }

public:
    // Like open()
    explicit Logger(FilePath filename);

    // Like use(), it accepts nullptr for which a dummy logger is created
    explicit Logger(FILE* stream) noexcept
    : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Opens file @p filename in append mode as log file, if fopen()
     *   error occurs exception is thrown and f_ (inner stream) is unchanged
     *
     * @param filename file to open
     *
     * @errors Throws an exception std::runtime_error if an fopen() error
     *   occurs
     */
    void open(FilePath filename);

    // Sets @p stream as log stream, nullptr is acceptable for the logger becomes a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
    private:
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit Appender(Logger& logger, Args&&... args)
        : logger_(logger)
        , label_(logger.label()) {
            operator()(std::forward<Args>(args)...);
        }

        void flush_impl(const char* newline_or_empty_str) noexcept;

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(app.flushed_)
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {
            app.flushed_ = true;
        }

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept { flush_impl("\n"); }

        // Like flush() but does not append the '\n' to the log
        void flush_no_nl() noexcept {
            flush_impl("");
            label_ = false;
        }

        ~Appender() { flush(); }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() { close(); }
};

// By default both write to stderr
inline Logger stdlog(stderr); // Standard (default) log
inline Logger errlog(stderr); // Error log
