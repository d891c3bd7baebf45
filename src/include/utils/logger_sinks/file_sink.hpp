#pragma once

#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace docgate::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * Owns a POSIX file descriptor opened with O_APPEND. Non-copyable, non-movable.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened (parent directories
     *         are created first).
     */
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error on a failed or short write.
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    int m_fd{-1};
};

} // namespace docgate::utils
