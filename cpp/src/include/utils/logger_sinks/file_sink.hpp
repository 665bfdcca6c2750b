#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace checkedval::utils
{

/**
 * @brief Appends formatted log lines to a file.
 *
 * The file is opened in append mode on construction and closed on destruction.
 * Non-copyable and non-movable since it owns the raw file handle.
 */
class CHECKEDVAL_UTILS_EXPORT FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending.
     */
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;
    FileSink(FileSink &&) = delete;
    FileSink &operator=(FileSink &&) = delete;

    /**
     * @throws std::system_error if the write is short.
     */
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
    std::FILE *m_file = nullptr;
};

} // namespace checkedval::utils
