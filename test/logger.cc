#include <cstdio>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <runlib/file_contents.hh>
#include <runlib/logger.hh>
#include <runlib/temporary_directory.hh>

using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(Logger, labelled_line) {
    TemporaryDirectory tmp_dir("/tmp/runlib-logger-test.XXXXXX");
    auto log_file = tmp_dir.path() + "log";
    {
        Logger log{log_file};
        log("abc ", 42, ' ', true);
    }
    EXPECT_THAT(
        get_file_contents(log_file),
        MatchesRegex("\\[ [0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2} \\] abc 42 true\n")
    );
}

// NOLINTNEXTLINE
TEST(Logger, unlabelled_lines) {
    TemporaryDirectory tmp_dir("/tmp/runlib-logger-test.XXXXXX");
    auto log_file = tmp_dir.path() + "log";
    {
        Logger log{log_file};
        log.label(false);
        log("first");
        auto appender = log("second");
        appender(' ', "continued");
        appender.flush_no_nl();
        appender(" end");
    }
    EXPECT_EQ(get_file_contents(log_file), "first\nsecond continued end\n");
}

// NOLINTNEXTLINE
TEST(Logger, open_appends) {
    TemporaryDirectory tmp_dir("/tmp/runlib-logger-test.XXXXXX");
    auto log_file = tmp_dir.path() + "log";
    put_file_contents(log_file, "old\n");
    Logger log{stderr};
    log.label(false);
    log.open(log_file);
    log("new");
    EXPECT_EQ(get_file_contents(log_file), "old\nnew\n");
}

// NOLINTNEXTLINE
TEST(Logger, dummy_logger) {
    Logger log{static_cast<FILE*>(nullptr)};
    log("ignored");
}

// NOLINTNEXTLINE
TEST(Logger, open_failure_throws) {
    EXPECT_THROW(Logger{"/nonexistent-dir/log"}, std::runtime_error);
}
