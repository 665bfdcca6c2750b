#include "ckv_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace checkedval::utils
{

FileSink::FileSink(const std::filesystem::path &path) : m_path(path)
{
    m_file = std::fopen(path.string().c_str(), "a");
    if (m_file == nullptr)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path.string(), ec.message()));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("write to '{}' failed", m_path.string()));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace checkedval::utils
