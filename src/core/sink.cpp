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
 * @file sink.cpp
 * @brief Stream and file sinks.
 */

#include "chromalog/core/sink.hpp"

#include <stdexcept>
#include <utility>

namespace chromalog::core {

StreamSink::StreamSink(std::ostream& stream) : stream_(stream) {}

bool StreamSink::write(std::string_view bytes)
{
    // The result reflects this write only, not an earlier failure.
    stream_.clear();
    stream_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    stream_.flush();
    return stream_.good();
}

/**
 * @brief Opens the log file in Append + Binary mode.
 *
 * Binary mode keeps the bytes written identical to the rendered line on every
 * platform (no newline translation).
 */
FileSink::FileSink(std::string path)
    : path_(std::move(path)), file_(path_, std::ios::binary | std::ios::app)
{
    if (!file_.is_open()) {
        throw std::runtime_error("cannot open log file '" + path_ + "'");
    }
}

bool FileSink::write(std::string_view bytes)
{
    file_.clear();
    file_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));

    // Push the line to the OS so that a crash right after logging loses nothing.
    file_.flush();
    return file_.good();
}

} // namespace chromalog::core
