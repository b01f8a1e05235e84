#include "utils/env/env.h"

#include <cstdlib>
#include <utility>

#include "utils/logging/logging.h"

namespace s3region::utils
{

namespace
{

int to_integer(const std::string & s, std::string::size_type * idx)
{
    return std::stoi(s, idx);
}

unsigned long to_unsigned_long(const std::string & s, std::string::size_type * idx)
{
    return std::stoul(s, idx);
}

template <typename T, typename F>
bool try_getenv_number(const std::string & variable, /* out */ T & value, F convert)
{
    std::string raw;
    if (!try_getenv<std::string>(variable, /* out */ raw))
    {
        return false;
    }

    std::string::size_type idx;
    value = convert(raw, /* out */ &idx);

    ASSERT(idx == raw.size()) << "Failed parsing environment variable '" << variable << "' value '" << raw << "' as an integer";

    return true;
}

} // namespace

template <>
bool try_getenv<std::string>(const std::string & variable, /* out */ std::string & value)
{
    const char * const raw = ::getenv(variable.c_str());

    if (raw == nullptr)
    {
        return false;
    }

    value = raw;
    return true;
}

template <>
bool try_getenv<int>(const std::string & variable, /* out */ int & value)
{
    return try_getenv_number(variable, value, to_integer);
}

template <>
bool try_getenv<unsigned long>(const std::string & variable, /* out */ unsigned long & value)
{
    return try_getenv_number(variable, value, to_unsigned_long);
}

template <>
bool try_getenv<bool>(const std::string & variable, /* out */ bool & value)
{
    int i;
    if (!try_getenv<int>(variable, /* out */ i))
    {
        return false;
    }

    value = static_cast<bool>(i);
    return true;
}

bool env_exists(const std::string & variable)
{
    return ::getenv(variable.c_str()) != nullptr;
}

namespace
{

template <typename T>
T required(const std::string & variable)
{
    T value;

    if (!try_getenv<T>(variable, /* out */ value))
    {
        LOG(ERROR) << "Environment variable '" << variable << "' is not set";
        throw std::exception();
    }

    return value;
}

template <typename T>
T optional(const std::string & variable, T def)
{
    T value;
    return try_getenv<T>(variable, /* out */ value) ? value : def;
}

} // namespace

template <>
std::string getenv<std::string>(const std::string & variable)
{
    return required<std::string>(variable);
}

template <>
int getenv<int>(const std::string & variable)
{
    return required<int>(variable);
}

template <>
unsigned long getenv<unsigned long>(const std::string & variable)
{
    return required<unsigned long>(variable);
}

template <>
bool getenv<bool>(const std::string & variable)
{
    return required<bool>(variable);
}

template <>
std::string getenv<std::string>(const std::string & variable, std::string def)
{
    return optional<std::string>(variable, std::move(def));
}

template <>
int getenv<int>(const std::string & variable, int def)
{
    return optional<int>(variable, def);
}

template <>
unsigned long getenv<unsigned long>(const std::string & variable, unsigned long def)
{
    return optional<unsigned long>(variable, def);
}

template <>
bool getenv<bool>(const std::string & variable, bool def)
{
    return optional<bool>(variable, def);
}

} // namespace s3region::utils
