#pragma once

#include "sink.hpp"
#include <cstdio>
#include <fmt/core.h>

namespace hublink::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogRecord &record, WriteMode mode) override
    {
        fmt::print(stderr, "{}", format_line(record, mode));
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace hublink::utils
