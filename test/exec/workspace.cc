#include <gtest/gtest.h>
#include <runlib/exec/language_profile.hh>
#include <runlib/exec/workspace.hh>
#include <runlib/file_contents.hh>
#include <runlib/file_info.hh>
#include <runlib/file_manip.hh>
#include <runlib/temporary_directory.hh>
#include <set>
#include <string>
#include <sys/stat.h>

using runlib::exec::generate_request_id;
using runlib::exec::LanguageProfile;
using runlib::exec::ProfileRegistry;
using runlib::exec::WorkspaceManager;
using std::string;

namespace {

const LanguageProfile& profile(const char* id) {
    static const ProfileRegistry registry;
    return *std::move(registry.resolve(id)).unwrap();
}

} // namespace

// NOLINTNEXTLINE
TEST(exec_workspace, generate_request_id) {
    std::set<string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_request_id();
        ASSERT_EQ(id.size(), 32U);
        for (char c : id) {
            EXPECT_TRUE((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f')) << id;
        }
        ids.emplace(id);
    }
    EXPECT_EQ(ids.size(), 100U);
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, creates_root) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path() + "a/b"};
    EXPECT_TRUE(is_directory(tmp_dir.path() + "a/b"));
    EXPECT_EQ(manager.root(), tmp_dir.path() + "a/b/");
    EXPECT_THROW(WorkspaceManager{"relative/path"}, std::runtime_error);
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, allocate_request_scoped) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto id = generate_request_id();
    auto ws = manager.allocate(id, profile("python"), "print(input())", "abc\n");

    EXPECT_EQ(ws.request_id(), id);
    EXPECT_EQ(ws.directory(), tmp_dir.path() + id + '/');
    EXPECT_EQ(ws.source_file(), ws.directory() + "source.py");
    EXPECT_EQ(ws.executable_file(), ws.directory() + "program");
    ASSERT_TRUE(ws.stdin_file().has_value());
    EXPECT_EQ(*ws.stdin_file(), ws.directory() + "stdin");
    EXPECT_EQ(get_file_contents(ws.source_file()), "print(input())");
    EXPECT_EQ(get_file_contents(*ws.stdin_file()), "abc\n");

    struct stat st {};
    ASSERT_EQ(stat(ws.directory().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700U);

    auto ph = ws.placeholders();
    EXPECT_EQ(ph.source, ws.source_file());
    EXPECT_EQ(ph.workdir, tmp_dir.path() + id);
    EXPECT_EQ(ph.executable, ws.executable_file());

    manager.release(ws);
    EXPECT_TRUE(ws.is_released());
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, empty_stdin_is_not_staged) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto ws = manager.allocate(generate_request_id(), profile("c"), "int main(){}", "");
    EXPECT_FALSE(ws.stdin_file().has_value());
    EXPECT_FALSE(path_exists(ws.directory() + "stdin"));
    manager.release(ws);
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, derived_names_do_not_collide) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    constexpr auto source = "public class Solution { }";
    auto ws1 = manager.allocate(generate_request_id(), profile("java"), source, "");
    auto ws2 = manager.allocate(generate_request_id(), profile("java"), source, "");

    EXPECT_EQ(ws1.entry_point(), "Solution");
    EXPECT_EQ(ws2.entry_point(), "Solution");
    EXPECT_EQ(ws1.source_file(), ws1.directory() + "Solution.java");
    EXPECT_EQ(ws2.source_file(), ws2.directory() + "Solution.java");
    EXPECT_NE(ws1.directory(), ws2.directory());
    EXPECT_NE(ws1.source_file(), ws2.source_file());

    manager.release(ws1);
    EXPECT_FALSE(path_exists(ws1.directory()));
    EXPECT_TRUE(is_regular_file(ws2.source_file()));
    manager.release(ws2);
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, default_entry_point_for_derived_naming) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto ws = manager.allocate(generate_request_id(), profile("java"), "class X {}", "");
    EXPECT_EQ(ws.entry_point(), "Main");
    EXPECT_EQ(ws.source_file(), ws.directory() + "Main.java");
    manager.release(ws);
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, existing_directory_is_never_reused) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto id = generate_request_id();
    ASSERT_EQ(mkdir_r(tmp_dir.path() + id), 0);
    EXPECT_THROW(manager.allocate(id, profile("c"), "x", ""), std::runtime_error);
    // The existing directory is left untouched
    EXPECT_TRUE(is_directory(tmp_dir.path() + id));
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, invalid_request_id) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    for (const char* id : {"", ".", "..", "a/b", "../x"}) {
        EXPECT_THROW(manager.allocate(id, profile("c"), "x", ""), std::runtime_error) << id;
    }
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, release_removes_everything_and_is_idempotent) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto ws = manager.allocate(generate_request_id(), profile("java"), "public class A {}", "in");

    // What the compiler and the program could leave behind
    put_file_contents(ws.directory() + "A.class", "bytecode");
    put_file_contents(ws.directory() + "A$Inner.class", "bytecode");
    put_file_contents(ws.directory() + "program", "binary");
    put_file_contents(ws.directory() + "output.txt", "data");
    ASSERT_EQ(mkdir_r(ws.directory() + "sub/dir"), 0);
    put_file_contents(ws.directory() + "sub/dir/file", "data");

    manager.release(ws);
    EXPECT_FALSE(path_exists(ws.directory()));
    EXPECT_TRUE(is_directory(tmp_dir.path()));
    EXPECT_NO_THROW(manager.release(ws));
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, release_of_already_removed_files) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    auto ws = manager.allocate(generate_request_id(), profile("c"), "x", "y");
    ASSERT_EQ(remove_r(ws.source_file()), 0);
    ASSERT_EQ(remove_r(*ws.stdin_file()), 0);
    EXPECT_NO_THROW(manager.release(ws));
    EXPECT_FALSE(path_exists(ws.directory()));
}

// NOLINTNEXTLINE
TEST(exec_WorkspaceManager, release_does_not_touch_siblings) {
    TemporaryDirectory tmp_dir("/tmp/runlib-workspace-test.XXXXXX");
    WorkspaceManager manager{tmp_dir.path()};
    put_file_contents(tmp_dir.path() + "sibling.class", "keep");
    auto ws = manager.allocate(generate_request_id(), profile("java"), "x", "");
    manager.release(ws);
    EXPECT_TRUE(is_regular_file(tmp_dir.path() + "sibling.class"));
}
