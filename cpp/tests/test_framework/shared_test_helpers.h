// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines CHECKEDVAL_IS_POSIX before any platform-conditional includes.
#include "ckv_platform.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for checkedval tests: stderr capture and log file inspection.
 */

#if CHECKEDVAL_IS_POSIX
#include <fcntl.h>
#include <unistd.h>
#else              // Windows
#include <cstdio>  // for _fileno, stderr
#include <fcntl.h> // For _O_BINARY
#include <io.h>
#define STDERR_FILENO _fileno(stderr)
typedef int ssize_t;
#endif

#include "gtest/gtest.h"

#include "ckv_base.hpp"

namespace checkedval::tests::helper
{

/**
 * @brief Redirects a file descriptor (normally stderr) into a pipe until GetOutput().
 *
 * Output larger than the pipe buffer would block the writer; keep captured output small.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture), original_fd_(-1)
    {
        std::fflush(stderr);
#if CHECKEDVAL_IS_POSIX
        if (pipe(pipe_fds_) != 0)
            return;
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
#else // Windows
        if (_pipe(pipe_fds_, 65536, _O_BINARY) != 0)
            return;
        original_fd_ = _dup(fd_to_capture_);
        _dup2(pipe_fds_[1], fd_to_capture_);
        _close(pipe_fds_[1]);
#endif
    }

    ~StringCapture() { restore(); }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput()
    {
        if (original_fd_ == -1)
            return {};
        restore();

        std::string output;
        std::vector<char> buffer(1024);
        ssize_t bytes_read;
#if CHECKEDVAL_IS_POSIX
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
        {
            output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
        }
        close(pipe_fds_[0]);
#else // Windows
        while ((bytes_read = _read(pipe_fds_[0], buffer.data(),
                                   static_cast<unsigned int>(buffer.size()))) > 0)
        {
            output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
        }
        _close(pipe_fds_[0]);
#endif
        return output;
    }

  private:
    void restore()
    {
        if (restored_ || original_fd_ == -1)
            return;
        std::fflush(stderr);
#if CHECKEDVAL_IS_POSIX
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
#else
        _dup2(original_fd_, fd_to_capture_);
        _close(original_fd_);
#endif
        restored_ = true;
    }

    int fd_to_capture_;
    int original_fd_;
    int pipe_fds_[2]{-1, -1};
    bool restored_{false};
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of @p text, optionally only those containing / lacking a substring.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief A unique path under the temp directory; any stale file there is removed.
 */
fs::path unique_temp_path(const std::string &stem, const std::string &extension = ".log");

} // namespace checkedval::tests::helper
