#pragma once

#include <runlib/file_path.hh>
#include <sys/stat.h>
#include <unistd.h>

inline bool path_exists(FilePath path) noexcept { return (access(path, F_OK) == 0); }

// Returns true iff @p file exists and is a regular file
inline bool is_regular_file(FilePath file) noexcept {
    struct stat st {};
    return (stat(file, &st) == 0 and S_ISREG(st.st_mode));
}

// Returns true iff @p file exists and is a directory
inline bool is_directory(FilePath file) noexcept {
    struct stat st {};
    return (stat(file, &st) == 0 and S_ISDIR(st.st_mode));
}
