#pragma once

#include "logger_sinks/base_file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <string>

namespace comphub::utils
{

// Appends formatted lines to a single file. Not rotated.
class FileSink : public Sink, private BaseFileSink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;
};

} // namespace comphub::utils
