#pragma once

#include <cstdio>
#include <iostream>
#include <string>

// glog-like stream logging; a line is formatted only when it is going to be written

namespace s3region::utils::logging
{

enum class Level
{
    // keep synced with the parsing of S3REGION_LOG_LEVEL in logging.cc
    SPAM = 0,
    DEBUG,
    INFO,
    WARNING, // default
    ERROR,
};

thread_local extern Level __minimum; // minimum level to log.
thread_local extern bool __print; // whether or not to print to stderr.
thread_local extern FILE * __file; // a file to log to; this is optional.

inline bool should_process_log(Level level, bool fatal)
{
    return fatal || ((level >= __minimum) && (__print || __file != nullptr));
}

enum class Color
{
    None = -1,

    // ANSI color codes
    RED     = 1,
    GREEN   = 2,
    YELLOW  = 3,
    BLUE    = 4,
    MAGENTA = 5,
};

Color color(Level level);

struct Message final
{
    struct Voidify final
    {
        void operator& (std::ostream&) {}
    };

    Message(
        Level level,
        bool fatal,
        bool log_errno,
        const char * level_str,
        const char * function,
        const char * file,
        int line);

    // throws if the message is fatal
    ~Message() noexcept(false);

    std::ostream& stream() { return _stream; }

 private:
    void write(FILE * f, bool colored) const;

    const Level _level;
    const int _errno;
    const bool _fatal;
    const bool _log_errno;

    char _raw[4096];

    // std::ostream over the fixed `_raw` buffer; whatever does not fit is dropped
    struct Stream final : std::ostream
    {
        Stream(char * raw, size_t length) : std::ostream(nullptr),
            _buffer(raw, length)
        {
            rdbuf(&_buffer);
        }

        size_t pcount() const
        {
            return _buffer.pcount();
        }

     private:
        struct Buffer final : std::streambuf
        {
            Buffer(char * raw, size_t length)
            {
                setp(raw, raw + length);
            }

            int_type overflow(int_type ch) override
            {
                return ch;
            }

            size_t pcount() const
            {
                return pptr() - pbase();
            }
        };

        Buffer _buffer;
    };

    Stream _stream;
};

std::string current_time();

#define LOGGING_LEVEL(level) (::s3region::utils::logging::Level:: level)

#define LOG_BASE(level, fatal, log_errno) (!::s3region::utils::logging::should_process_log(LOGGING_LEVEL(level), fatal)) ? \
                                              (void) 0 : \
                                              ::s3region::utils::logging::Message::Voidify() & ::s3region::utils::logging::Message(LOGGING_LEVEL(level), fatal, log_errno, # level, __func__, __FILE__, __LINE__).stream()

#define LOG(level) LOG_BASE(level, false, false)

#define LOG_BASE_IF(level, fatal, log_errno, condition) \
  !(condition) ? (void) 0 : LOG_BASE(level, fatal, log_errno)

#define LOG_IF(level, condition) LOG_BASE_IF(level, false, false, condition)

#define CHECK(condition) LOG_BASE_IF(WARNING, false, false, !(condition))
#define ASSERT(condition) LOG_BASE_IF(ERROR, true, false, !(condition))
#define PASSERT(condition) LOG_BASE_IF(ERROR, true, true, !(condition))

} // namespace s3region::utils::logging
