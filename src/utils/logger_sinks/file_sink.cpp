#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#if defined(DOCGATE_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace docgate::utils
{

FileSink::FileSink(const std::filesystem::path &path) : m_path(path)
{
    if (m_path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("Failed to create log directory '{}': {}",
                                                 m_path.parent_path().string(), ec.message()));
        }
    }
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': {}", m_path.string(),
                                             std::generic_category().message(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = format_logmsg(msg);
    const ssize_t written = ::write(m_fd, line.data(), line.size());
    if (written < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("write to '{}' failed", m_path.string()));
    }
    if (static_cast<size_t>(written) != line.size())
    {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                fmt::format("short write to '{}'", m_path.string()));
    }
}

void FileSink::flush()
{
    if (m_fd != -1 && ::fsync(m_fd) != 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("fsync of '{}' failed", m_path.string()));
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace docgate::utils
