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
 * @file logger_test.cpp
 * @brief Unit tests for the logger's output pipeline and entry points.
 *
 * @details
 * Validates the guarantees callers rely on:
 * 1. Filtering: suppressed calls never reach the sink.
 * 2. Framing: one write per accepted call, ending in exactly one newline.
 * 3. Concurrency: lines from parallel threads never interleave.
 * 4. Termination: `fatal*` exits and `panic*` throws after emitting.
 */

#include "chromalog/core/logger.hpp"
#include "framework.hpp"
#include "memory_sink.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <streambuf>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace core = chromalog::core;
namespace fs = std::filesystem;
using chromalog::test::FailingSink;
using chromalog::test::MemorySink;

namespace {

/// 2024-01-02T03:04:05Z
const std::chrono::system_clock::time_point kFixedTime =
    std::chrono::system_clock::time_point(std::chrono::seconds(1704164645));

const core::Site kSite{"a/b/c.go", 42};

/**
 * @brief A stream buffer whose first write fails and whose later writes succeed.
 */
class RecoveringBuf : public std::streambuf {
  public:
    std::string received;

  protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
        if (!failed_once_) {
            failed_once_ = true;
            return 0;
        }
        received.append(s, static_cast<size_t>(n));
        return n;
    }

    int_type overflow(int_type ch) override
    {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        char c = traits_type::to_char_type(ch);
        return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
    }

  private:
    bool failed_once_ = false;
};

} // namespace

/**
 * @brief A new logger starts at INFO for both default level and filter.
 */
void test_logger_defaults()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "pfx ", core::kStdFlags);

    ASSERT_EQ(log.flags(), static_cast<int>(core::kStdFlags));
    ASSERT_EQ(log.prefix(), std::string("pfx "));
    ASSERT_EQ(log.default_level(), static_cast<int>(core::INFO));
    ASSERT_EQ(log.level_filter(), static_cast<int>(core::INFO));

    // Construction performs no I/O.
    ASSERT_EQ(sink->count(), static_cast<size_t>(0));
}

void test_logger_rejects_null_sink()
{
    ASSERT_THROWS(std::invalid_argument, core::Logger log(nullptr, "", 0));

    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);
    ASSERT_THROWS(std::invalid_argument, log.set_output(nullptr));
}

/**
 * @brief Calls below the filter produce zero bytes at every level.
 */
void test_logger_filter_suppresses()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    for (int filter = core::TRACE; filter <= core::FATAL; ++filter) {
        log.set_level_filter(filter);
        for (int level = core::TRACE; level < filter; ++level) {
            ASSERT_TRUE(log.output(kSite, level, "dropped"));
        }
    }
    ASSERT_EQ(sink->count(), static_cast<size_t>(0));
}

/**
 * @brief Calls at or above the filter produce exactly one write each.
 */
void test_logger_filter_passes()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kLevel);
    log.set_level_filter(core::WARN);

    CHROMALOG_WARN(log, "w");
    CHROMALOG_ERROR(log, "e");
    ASSERT_EQ(sink->count(), static_cast<size_t>(2));
    ASSERT_EQ(sink->writes()[0], std::string("[W] w\n"));
    ASSERT_EQ(sink->writes()[1], std::string("[E] e\n"));
}

/**
 * @brief Filter WARN: an INFO call writes nothing and would_log agrees.
 */
void test_logger_would_log()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kStdFlags);
    log.set_level_filter(core::WARN);

    ASSERT_TRUE(CHROMALOG_INFO(log, "x"));
    ASSERT_EQ(sink->count(), static_cast<size_t>(0));
    ASSERT_FALSE(log.would_log(core::INFO));
    ASSERT_TRUE(log.would_log(core::WARN));
    ASSERT_TRUE(log.would_log(core::FATAL));
}

/**
 * @brief With no flags the line is exactly prefix + message + newline.
 */
void test_logger_no_flags_exact()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "svc: ", 0);

    CHROMALOG_INFO(log, "hello");
    ASSERT_EQ(sink->last(), std::string("svc: hello\n"));

    log.set_prefix("");
    CHROMALOG_INFO(log, "bare");
    ASSERT_EQ(sink->last(), std::string("bare\n"));
}

/**
 * @brief A message that already ends in a newline gets no second one; an empty
 * message gets none at all.
 */
void test_logger_newline_handling()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "p: ", 0);

    log.output(kSite, core::INFO, "done\n");
    ASSERT_EQ(sink->last(), std::string("p: done\n"));

    log.output(kSite, core::INFO, "");
    ASSERT_EQ(sink->last(), std::string("p: "));

    log.output(kSite, core::INFO, "two\n\n");
    ASSERT_EQ(sink->last(), std::string("p: two\n\n"));
    ASSERT_EQ(sink->count(), static_cast<size_t>(3));
}

/**
 * @brief Setting flags then reading them back yields the same bitset.
 */
void test_logger_flags_round_trip()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    for (int flags = 0; flags < (1 << 8); ++flags) {
        log.set_flags(flags);
        ASSERT_EQ(log.flags(), flags);
    }
}

void test_logger_accessors()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    log.set_prefix("[db] ");
    log.set_default_level(core::DEBUG);
    log.set_level_filter(core::ERROR);
    ASSERT_EQ(log.prefix(), std::string("[db] "));
    ASSERT_EQ(log.default_level(), static_cast<int>(core::DEBUG));
    ASSERT_EQ(log.level_filter(), static_cast<int>(core::ERROR));
}

/**
 * @brief Date and time rendered from a pinned clock.
 */
void test_logger_fixed_time()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kDate | core::kTime | core::kUTC);
    log.set_clock([] { return kFixedTime; });

    CHROMALOG_INFO(log, "hello");
    ASSERT_EQ(sink->last(), std::string("2024/01/02 03:04:05 hello\n"));
}

/**
 * @brief Short-file rendering keeps only the base name of the call site.
 */
void test_logger_short_file()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kShortFile);

    log.info(kSite, "x");
    ASSERT_EQ(sink->last(), std::string("c.go:42: x\n"));

    log.set_flags(core::kLongFile);
    log.info(kSite, "x");
    ASSERT_EQ(sink->last(), std::string("a/b/c.go:42: x\n"));
}

/**
 * @brief The macros resolve to the line that invoked them, not to the library.
 */
void test_logger_macro_call_site()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kShortFile);

    const int line = __LINE__ + 1;
    CHROMALOG_WARN(log, "here");

    ASSERT_EQ(sink->last(), "logger_test.cpp:" + std::to_string(line) + ": here\n");
}

/**
 * @brief An unknown call site renders the `???:0` sentinel.
 */
void test_logger_unknown_site()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kShortFile);

    log.output(core::ERROR, "lost");
    ASSERT_EQ(sink->last(), std::string("???:0: lost\n"));

    log.output(core::Site{nullptr, 7}, core::ERROR, "null");
    ASSERT_EQ(sink->last(), std::string("???:0: null\n"));
}

/**
 * @brief Concatenation puts spaces only between adjacent non-text operands.
 */
void test_logger_concat_forms()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    CHROMALOG_INFO(log, "port ", 5555, " open");
    ASSERT_EQ(sink->last(), std::string("port 5555 open\n"));

    CHROMALOG_INFO(log, 1, 2, "x", 3, true);
    ASSERT_EQ(sink->last(), std::string("1 2x3 true\n"));

    CHROMALOG_INFOLN(log, "a", 1, std::string("b"), 2.5);
    ASSERT_EQ(sink->last(), std::string("a 1 b 2.5\n"));

    CHROMALOG_INFOF(log, "%s=%05d", "id", 42);
    ASSERT_EQ(sink->last(), std::string("id=00042\n"));
}

/**
 * @brief A null C string operand renders as "(null)" in every form.
 */
void test_logger_null_c_string()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);
    const char* missing = nullptr;

    CHROMALOG_INFO(log, "user=", missing);
    ASSERT_EQ(sink->last(), std::string("user=(null)\n"));

    CHROMALOG_INFOLN(log, "user", missing, 7);
    ASSERT_EQ(sink->last(), std::string("user (null) 7\n"));
}

/**
 * @brief printf-style output longer than the internal stack buffer.
 */
void test_logger_long_printf()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    std::string big(2000, 'z');
    CHROMALOG_ERRORF(log, "[%s]", big.c_str());
    ASSERT_EQ(sink->last(), "[" + big + "]\n");
}

/**
 * @brief Every level-tagged entry point writes at its own level.
 */
void test_logger_entry_point_levels()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kLevel);
    log.set_level_filter(core::TRACE);

    CHROMALOG_TRACE(log, "t");
    CHROMALOG_DEBUGF(log, "%s", "d");
    CHROMALOG_INFOLN(log, "i");
    CHROMALOG_WARN(log, "w");
    CHROMALOG_ERRORLN(log, "e");

    auto writes = sink->writes();
    ASSERT_EQ(writes.size(), static_cast<size_t>(5));
    ASSERT_EQ(writes[0], std::string("[T] t\n"));
    ASSERT_EQ(writes[1], std::string("[D] d\n"));
    ASSERT_EQ(writes[2], std::string("[I] i\n"));
    ASSERT_EQ(writes[3], std::string("[W] w\n"));
    ASSERT_EQ(writes[4], std::string("[E] e\n"));
}

/**
 * @brief Level-less calls use the configured default level.
 */
void test_logger_print_uses_default_level()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kLevel);

    CHROMALOG_PRINT(log, "a");
    ASSERT_EQ(sink->last(), std::string("[I] a\n"));

    log.set_default_level(core::ERROR);
    CHROMALOG_PRINTF(log, "%d", 7);
    ASSERT_EQ(sink->last(), std::string("[E] 7\n"));

    // A default level below the filter is filtered like any other call.
    log.set_default_level(core::DEBUG);
    CHROMALOG_PRINTLN(log, "hidden");
    ASSERT_EQ(sink->count(), static_cast<size_t>(2));
}

/**
 * @brief Sink failures surface as a false return and are not retried.
 */
void test_logger_sink_failure()
{
    auto sink = std::make_shared<FailingSink>();
    core::Logger log(sink, "", 0);

    ASSERT_FALSE(CHROMALOG_ERROR(log, "unwritable"));
    ASSERT_EQ(sink->attempts, 1);

    // Filtered calls never touch the sink and are not failures.
    ASSERT_TRUE(CHROMALOG_DEBUG(log, "filtered"));
    ASSERT_EQ(sink->attempts, 1);
}

/**
 * @brief A stream that failed once accepts later lines again.
 */
void test_logger_stream_recovers_after_failure()
{
    RecoveringBuf device;
    std::ostream stream(&device);
    core::Logger log(std::make_shared<core::StreamSink>(stream), "", 0);

    ASSERT_FALSE(log.output(core::INFO, "lost"));
    ASSERT_TRUE(log.output(core::INFO, "second"));
    ASSERT_TRUE(log.output(core::INFO, "third"));
    ASSERT_EQ(device.received, std::string("second\nthird\n"));
}

void test_logger_custom_formatter()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "ignored", core::kDefaultFlags);

    log.set_formatter([](const core::LogMessage& msg, std::string& buf) {
        buf.append(core::level_name(msg.level));
        buf.append(" | ");
    });
    CHROMALOG_WARN(log, "custom");
    ASSERT_EQ(sink->last(), std::string("WARN | custom\n"));

    // A null formatter brings the default rendering back.
    log.set_formatter(std::shared_ptr<const core::Formatter>());
    log.set_flags(0);
    CHROMALOG_WARN(log, "default");
    ASSERT_EQ(sink->last(), std::string("ignoreddefault\n"));
}

/**
 * @brief The scratch buffer never leaks content from a previous call.
 */
void test_logger_buffer_reuse()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);

    CHROMALOG_INFO(log, std::string(300, 'a'));
    CHROMALOG_INFO(log, "b");
    ASSERT_EQ(sink->last(), std::string("b\n"));
}

void test_logger_set_output()
{
    auto first = std::make_shared<MemorySink>();
    auto second = std::make_shared<MemorySink>();
    core::Logger log(first, "", 0);

    CHROMALOG_INFO(log, "one");
    log.set_output(second);
    CHROMALOG_INFO(log, "two");

    ASSERT_EQ(first->count(), static_cast<size_t>(1));
    ASSERT_EQ(second->count(), static_cast<size_t>(1));
    ASSERT_EQ(second->last(), std::string("two\n"));
}

/**
 * @brief Parallel writers never interleave partial lines.
 *
 * Each write must hold exactly one complete, well-formed line.
 */
void test_logger_concurrent_lines()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kLevel | core::kMicroseconds);

    const int threads = 8;
    const int per_thread = 250;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&log, t] {
            for (int i = 0; i < per_thread; ++i) {
                CHROMALOG_INFOF(log, "worker=%d seq=%d payload=%s", t, i,
                                "abcdefghijklmnopqrstuvwxyz");
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto writes = sink->writes();
    ASSERT_EQ(writes.size(), static_cast<size_t>(threads * per_thread));

    std::vector<int> next_seq(threads, 0);
    for (const auto& line : writes) {
        ASSERT_TRUE(line.rfind("[I] ", 0) == 0);
        ASSERT_EQ(line.find('\n'), line.size() - 1);

        int worker = -1;
        int seq = -1;
        char payload[64] = {0};
        int matched = std::sscanf(line.c_str() + 20, "worker=%d seq=%d payload=%63s", &worker,
                                  &seq, payload);
        ASSERT_EQ(matched, 3);
        ASSERT_EQ(std::string(payload), std::string("abcdefghijklmnopqrstuvwxyz"));

        // Lines of one thread keep their program order.
        ASSERT_EQ(seq, next_seq[worker]);
        next_seq[worker]++;
    }
}

/**
 * @brief Panic emits at FATAL and then throws the formatted text.
 */
void test_logger_panic()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", core::kLevel);

    std::string what;
    try {
        CHROMALOG_PANICF(log, "bad state %d", 7);
    } catch (const core::Panic& e) {
        what = e.what();
    }
    ASSERT_EQ(what, std::string("bad state 7"));
    ASSERT_EQ(sink->last(), std::string("[F] bad state 7\n"));

    ASSERT_THROWS(core::Panic, CHROMALOG_PANIC(log, "a", 1));
    ASSERT_THROWS(core::Panic, CHROMALOG_PANICLN(log, "b", 2));
    ASSERT_EQ(sink->last(), std::string("[F] b 2\n"));
}

/**
 * @brief Panic still throws when the filter suppresses FATAL.
 */
void test_logger_panic_when_filtered()
{
    auto sink = std::make_shared<MemorySink>();
    core::Logger log(sink, "", 0);
    log.set_level_filter(core::FATAL + 1);

    ASSERT_THROWS(core::Panic, CHROMALOG_PANIC(log, "silent"));
    ASSERT_EQ(sink->count(), static_cast<size_t>(0));
}

namespace {

/**
 * @brief Runs `body` in a forked child and returns its exit status.
 * @return The exit code, or -1 if the child did not exit normally.
 */
template <typename F> int run_in_child(F body)
{
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid == 0) {
        // The child must never fall back into the test runner.
        try {
            body();
        } catch (const std::exception&) {
            _exit(98);
        }
        _exit(99);
    }
    if (pid < 0) {
        return -1;
    }

    int status = 0;
    if (waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

} // namespace

/**
 * @brief Fatal writes the line and exits with status 1.
 */
void test_logger_fatal_exits()
{
    const std::string path = "./test_fatal_exit.log";
    fs::remove(path);

    int status = run_in_child([&path] {
        core::Logger log(std::make_shared<core::FileSink>(path), "", core::kLevel);
        CHROMALOG_FATALF(log, "disk %s gone", "sda");
    });

    ASSERT_EQ(status, 1);
    ASSERT_EQ(read_file(path), std::string("[F] disk sda gone\n"));
    fs::remove(path);
}

/**
 * @brief Fatal terminates even when the filter suppressed its line.
 *
 * Termination is unconditional while the write is filtered.
 */
void test_logger_fatal_exits_when_filtered()
{
    const std::string path = "./test_fatal_filtered.log";
    fs::remove(path);

    int status = run_in_child([&path] {
        core::Logger log(std::make_shared<core::FileSink>(path), "", 0);
        log.set_level_filter(core::FATAL + 1);
        CHROMALOG_FATAL(log, "never written");
    });

    ASSERT_EQ(status, 1);
    ASSERT_EQ(read_file(path), std::string(""));
    fs::remove(path);
}

/**
 * @brief Fatal terminates even when the sink fails.
 */
void test_logger_fatal_exits_on_write_failure()
{
    int status = run_in_child([] {
        core::Logger log(std::make_shared<FailingSink>(), "", 0);
        CHROMALOG_FATALLN(log, "unwritable");
    });
    ASSERT_EQ(status, 1);
}
