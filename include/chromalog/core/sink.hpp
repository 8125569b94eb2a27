/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file sink.hpp
 * @brief Byte-stream destinations for rendered log lines.
 *
 * @details
 * A logger hands each finished line to its sink in a single `write()` call.
 * Sinks perform no locking of their own: serialization is the logger's job.
 */

#pragma once

#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

namespace chromalog::core {

/**
 * @class Sink
 * @brief Abstract destination of log lines.
 */
class Sink {
  public:
    virtual ~Sink() = default;

    /**
     * @brief Writes `bytes` in full.
     * @return false if the underlying device reported a failure. The logger
     * does not retry.
     */
    virtual bool write(std::string_view bytes) = 0;
};

/**
 * @class StreamSink
 * @brief Writes to a borrowed `std::ostream` (typically `std::cerr`).
 *
 * The stream must outlive the sink. Each line is flushed so that output is
 * visible immediately, matching the unbuffered behavior of standard error.
 */
class StreamSink : public Sink {
  public:
    explicit StreamSink(std::ostream& stream);

    bool write(std::string_view bytes) override;

  private:
    std::ostream& stream_;
};

/**
 * @class FileSink
 * @brief Appends to a file opened in binary append mode.
 *
 * @details
 * The file is created if it does not exist and is never truncated. Because
 * the stream is opened with `std::ios::app`, every write lands at the current
 * end of file even if other processes append to it too.
 */
class FileSink : public Sink {
  public:
    /**
     * @brief Opens `path` for appending.
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileSink(std::string path);

    bool write(std::string_view bytes) override;

    /// @brief The path this sink appends to.
    const std::string& path() const { return path_; }

  private:
    std::string path_;
    std::ofstream file_;
};

} // namespace chromalog::core
