#include "utils/logging/logging.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace s3region::utils::logging
{

namespace
{

Level init_minimum()
{
    const char * const level = ::getenv("S3REGION_LOG_LEVEL");

    if (level != nullptr)
    {
        if      (!strcmp(level, "SPAM"))    { return Level::SPAM;    } // NOLINT(readability/braces)
        else if (!strcmp(level, "DEBUG"))   { return Level::DEBUG;   } // NOLINT(readability/braces)
        else if (!strcmp(level, "INFO"))    { return Level::INFO;    } // NOLINT(readability/braces)
        else if (!strcmp(level, "WARNING")) { return Level::WARNING; } // NOLINT(readability/braces)
        else if (!strcmp(level, "ERROR"))   { return Level::ERROR;   } // NOLINT(readability/braces)
    }

    return Level::WARNING;
}

bool init_print()
{
    const char * const value = ::getenv("S3REGION_LOG_TO_STDERR");

    return value != nullptr && strcmp(value, "1") == 0;
}

// the log file is opened once per process and shared by all threads
struct LogFile
{
    explicit LogFile(const char * path) : _f(::fopen(path, "a"))
    {
        if (_f != nullptr)
        {
            ::setlinebuf(_f);
        }
    }

    ~LogFile()
    {
        if (_f != nullptr)
        {
            ::fclose(_f);
        }
    }

    FILE * get() const { return _f; }

 private:
    FILE * _f = nullptr;
};

FILE * init_file()
{
    const char * const path = ::getenv("S3REGION_LOG_FILE");

    if (path == nullptr)
    {
        return nullptr;
    }

    static LogFile __f(path);
    return __f.get();
}

} // namespace

thread_local Level __minimum = init_minimum();
thread_local bool __print = init_print();
thread_local FILE * __file = init_file();

Color color(Level level)
{
    switch (level)
    {
        case Level::SPAM:       return Color::BLUE;
        case Level::DEBUG:      return Color::MAGENTA;
        case Level::INFO:       return Color::GREEN;
        case Level::WARNING:    return Color::YELLOW;
        case Level::ERROR:      return Color::RED;
    }

    return Color::None;
}

std::string current_time()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};

    std::ostringstream s;

    if (::localtime_r(&t, &local) == nullptr)
    {
        s << "invalid time";
        return s.str();
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    s << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return s.str();
}

Message::Message(
            Level level,
            bool fatal,
            bool log_errno,
            const char * level_str,
            const char * function,
            const char * file,
            int line) :
    _level(level),
    _errno(errno),
    _fatal(fatal),
    _log_errno(log_errno),
    _raw(),
    _stream(_raw, sizeof(_raw))
{
    _stream << std::left << "[" << current_time() << "] [" << std::setw(7) << level_str << "] " <<
        "[" << ::getpid() << " " << ::syscall(SYS_gettid) << "] ";

    // pad the prefix so that messages are aligned
    static constexpr auto PREFIX_WIDTH = 100l;
    _stream << "[" << file << ":" << std::right << std::setw(3) << line << " @ " <<
        function << std::setw(std::max<std::streamoff>(0, PREFIX_WIDTH - static_cast<int64_t>(_stream.pcount()))) << "] ";
}

void Message::write(FILE * f, bool colored) const
{
    const auto c = color(_level);
    colored = colored && c != Color::None;

    if (colored)
    {
        fprintf(f, "\033[0;3%dm", static_cast<int>(c));
    }

    fwrite(_raw, _stream.pcount(), 1, f);

    if (colored)
    {
        fprintf(f, "\033[m");
    }
}

Message::~Message() noexcept(false)
{
    if (_log_errno)
    {
        _stream << ": " << ::strerror(_errno) << " [" << _errno << "]";
    }

    _stream << "\n";

    if (_level >= __minimum)
    {
        if (__print)
        {
            write(stderr, true);
        }

        if (__file != nullptr)
        {
            write(__file, false);
        }
    }

    // writing may have changed errno
    errno = _errno;

    if (_fatal)
    {
        if (_log_errno)
        {
            throw std::system_error(_errno, std::generic_category());
        }

        throw std::exception();
    }
}

} // namespace s3region::utils::logging
