#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace hublink::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("Failed to create log directory '{}': {}",
                                                 m_path.parent_path().string(), ec.message()));
        }
    }
    m_file = std::fopen(m_path.string().c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogRecord &record, WriteMode mode)
{
    const auto line = format_line(record, mode);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::runtime_error(
            fmt::format("Short write to log file '{}': {}", m_path.string(), std::strerror(errno)));
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

} // namespace hublink::utils
