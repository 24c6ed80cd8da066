#pragma once

#include <cstddef>
#include <runlib/file_path.hh>
#include <string>
#include <string_view>
#include <sys/types.h>

/**
 * @brief Reads until @p count bytes are read, EOF is reached or an error
 *   other than EINTR occurs
 *
 * @return number of bytes read; if it is smaller than @p count, errno is set
 *   to 0 on EOF or to the error that occurred
 */
size_t read_all(int fd, void* buf, size_t count) noexcept;

/**
 * @brief Writes until @p count bytes are written or an error other than EINTR
 *   occurs
 *
 * @return number of bytes written; if it is smaller than @p count, errno is
 *   set appropriately
 */
size_t write_all(int fd, const void* buf, size_t count) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads the whole file, throws std::runtime_error on error
std::string get_file_contents(FilePath file);

// Reads everything that is left in @p fd, throws std::runtime_error on error
std::string get_file_contents(int fd);

// Creates or truncates @p file and writes @p data to it, throws std::runtime_error on error
void put_file_contents(FilePath file, std::string_view data, mode_t mode = 0644);
