#include <gtest/gtest.h>
#include <runlib/exec/language_profile.hh>
#include <string>
#include <vector>

using runlib::exec::ArtifactNaming;
using runlib::exec::builtin_profiles;
using runlib::exec::expand_command;
using runlib::exec::extract_entry_point;
using runlib::exec::LanguageProfile;
using runlib::exec::Placeholders;
using runlib::exec::ProfileRegistry;
using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, resolve_is_case_insensitive) {
    ProfileRegistry registry;
    for (const char* id : {"c", "C", "cpp", "CPP", "python", "Python", "bash", "java", "JaVa"}) {
        auto res = registry.resolve(id);
        ASSERT_TRUE(res.is_ok()) << id;
    }
    auto res = registry.resolve("PyThOn");
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(std::move(res).unwrap()->id, "python");
}

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, unknown_language) {
    ProfileRegistry registry;
    for (const char* id : {"", "ruby", "c++", "pythonn", " c"}) {
        auto res = registry.resolve(id);
        ASSERT_TRUE(res.is_err()) << id;
        EXPECT_EQ(std::move(res).unwrap_err().language_id, id);
    }
}

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, builtin_profiles) {
    ProfileRegistry registry;
    const auto& c = *std::move(registry.resolve("c")).unwrap();
    EXPECT_TRUE(c.has_compile_step());
    EXPECT_EQ(c.source_extension, ".c");
    EXPECT_EQ(c.run_command, vector<string>{"{executable}"});
    EXPECT_EQ(c.artifact_naming, ArtifactNaming::REQUEST_SCOPED);

    const auto& python = *std::move(registry.resolve("python")).unwrap();
    EXPECT_FALSE(python.has_compile_step());
    EXPECT_EQ(python.run_command, (vector<string>{"python3", "{source}"}));

    const auto& java = *std::move(registry.resolve("java")).unwrap();
    EXPECT_TRUE(java.has_compile_step());
    EXPECT_EQ(java.artifact_naming, ArtifactNaming::DERIVED_FROM_SOURCE);
    EXPECT_EQ(java.default_entry_point, "Main");
    EXPECT_EQ(java.secondary_artifact_suffixes, vector<string>{".class"});
    EXPECT_EQ(java.run_command, (vector<string>{"java", "-cp", "{workdir}", "{entry_point}"}));
}

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, custom_profiles) {
    ProfileRegistry registry{{
        LanguageProfile{
            .id = "AWK",
            .source_extension = ".awk",
            .compile_command = std::nullopt,
            .run_command = {"awk", "-f", "{source}"},
            .artifact_naming = ArtifactNaming::REQUEST_SCOPED,
            .default_entry_point = "main",
            .secondary_artifact_suffixes = {},
            .toolchain_executable = "awk",
        },
    }};
    EXPECT_TRUE(registry.resolve("awk").is_ok());
    EXPECT_TRUE(registry.resolve("c").is_err());
}

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, invalid_profiles) {
    auto profile = LanguageProfile{
        .id = "x",
        .source_extension = ".x",
        .compile_command = std::nullopt,
        .run_command = {"x"},
    };
    EXPECT_THROW(ProfileRegistry({profile, profile}), std::runtime_error);

    auto no_run = profile;
    no_run.run_command.clear();
    EXPECT_THROW(ProfileRegistry({no_run}), std::runtime_error);

    auto no_id = profile;
    no_id.id.clear();
    EXPECT_THROW(ProfileRegistry({no_id}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(exec_ProfileRegistry, restricted_to) {
    ProfileRegistry registry;
    auto restricted = registry.restricted_to({"Python", "c"});
    EXPECT_EQ(restricted.profiles().size(), 2U);
    EXPECT_TRUE(restricted.resolve("python").is_ok());
    EXPECT_TRUE(restricted.resolve("c").is_ok());
    EXPECT_TRUE(restricted.resolve("java").is_err());
    EXPECT_THROW((void)registry.restricted_to({"cobol"}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(exec_language_profile, expand_command) {
    Placeholders ph{
        .source = "/w/id/Main.java",
        .executable = "/w/id/program",
        .workdir = "/w/id",
        .entry_point = "Main",
    };
    EXPECT_EQ(
        expand_command({"javac", "-d", "{workdir}", "{source}"}, ph),
        (vector<string>{"javac", "-d", "/w/id", "/w/id/Main.java"})
    );
    EXPECT_EQ(
        expand_command({"-o{executable}", "{entry_point}.{entry_point}", "{unknown}", "{"}, ph),
        (vector<string>{"-o/w/id/program", "Main.Main", "{unknown}", "{"})
    );
    EXPECT_EQ(expand_command({}, ph), vector<string>{});
}

// NOLINTNEXTLINE
TEST(exec_language_profile, extract_entry_point) {
    EXPECT_EQ(extract_entry_point("public class Hello { }", "Main"), "Hello");
    EXPECT_EQ(extract_entry_point("import x;\npublic  \n class\tFoo_1$ {}", "Main"), "Foo_1$");
    EXPECT_EQ(extract_entry_point("class Hidden {}\npublic class Shown {}", "Main"), "Shown");
    EXPECT_EQ(
        extract_entry_point("public static void x(); public class First {} public class B", "M"),
        "First"
    );
    EXPECT_EQ(extract_entry_point("class NoPublic {}", "Main"), "Main");
    EXPECT_EQ(extract_entry_point("", "Main"), "Main");
    EXPECT_EQ(extract_entry_point("publicclass X", "Main"), "Main");
    // Nothing that could escape the request directory
    EXPECT_EQ(extract_entry_point("public class ../../etc/passwd", "Main"), "Main");
    EXPECT_EQ(extract_entry_point("public class Evil/../../x", "Main"), "Evil");
}
