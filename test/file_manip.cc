#include <fcntl.h>
#include <gtest/gtest.h>
#include <runlib/file_contents.hh>
#include <runlib/file_descriptor.hh>
#include <runlib/file_info.hh>
#include <runlib/file_manip.hh>
#include <runlib/temporary_directory.hh>
#include <unistd.h>

// NOLINTNEXTLINE
TEST(file_manip, mkdir_r_creates_nested_directories) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-manip-test.XXXXXX");
    auto path = tmp_dir.path() + "a/b/c";
    ASSERT_EQ(mkdir_r(path), 0);
    EXPECT_TRUE(is_directory(tmp_dir.path() + "a"));
    EXPECT_TRUE(is_directory(path));
    // Existing directories are fine
    EXPECT_EQ(mkdir_r(path + '/'), 0);
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r_removes_tree) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-manip-test.XXXXXX");
    auto root = tmp_dir.path() + "root";
    ASSERT_EQ(mkdir_r(root + "/x/y"), 0);
    put_file_contents(root + "/file", "abc");
    put_file_contents(root + "/x/y/file", "def");
    ASSERT_EQ(symlink("/etc", (root + "/link").c_str()), 0);

    ASSERT_EQ(remove_r(root), 0);
    EXPECT_FALSE(path_exists(root));
    // Symlinks are removed, not followed
    EXPECT_TRUE(is_directory("/etc"));
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r_of_regular_file) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-manip-test.XXXXXX");
    auto file = tmp_dir.path() + "file";
    put_file_contents(file, "");
    EXPECT_TRUE(is_regular_file(file));
    ASSERT_EQ(remove_r(file), 0);
    EXPECT_FALSE(path_exists(file));
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r_of_missing_path) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-manip-test.XXXXXX");
    EXPECT_EQ(remove_r(tmp_dir.path() + "missing"), -1);
    EXPECT_EQ(errno, ENOENT);
}

// NOLINTNEXTLINE
TEST(file_contents, put_and_get) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-contents-test.XXXXXX");
    auto file = tmp_dir.path() + "file";
    put_file_contents(file, std::string("a\0b\nc", 5));
    EXPECT_EQ(get_file_contents(file), std::string("a\0b\nc", 5));
    put_file_contents(file, "x");
    EXPECT_EQ(get_file_contents(file), "x");
}

// NOLINTNEXTLINE
TEST(file_contents, get_of_missing_file_throws) {
    TemporaryDirectory tmp_dir("/tmp/runlib-file-contents-test.XXXXXX");
    EXPECT_THROW(get_file_contents(tmp_dir.path() + "missing"), std::runtime_error);
}
