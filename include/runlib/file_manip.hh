#pragma once

#include <runlib/file_path.hh>
#include <string>
#include <sys/types.h>

/**
 * @brief Creates directories from @p path if they do not exist (like mkdir -p)
 *
 * @return 0 on success, -1 on error with errno set appropriately
 */
int mkdir_r(std::string path, mode_t mode = 0755) noexcept;

/**
 * @brief Removes recursively file or directory @p path relative to a directory
 *   file descriptor @p dirfd; symbolic links are removed, not followed
 *
 * @return 0 on success, -1 on error with errno set appropriately
 */
int remove_rat(int dirfd, FilePath path) noexcept;

// Like remove_rat() with dirfd == AT_FDCWD
int remove_r(FilePath path) noexcept;
