#pragma once

#include "sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace hublink::utils
{

// Append-only file destination. Throws std::runtime_error if the file cannot be opened.
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogRecord &record, WriteMode mode) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace hublink::utils
