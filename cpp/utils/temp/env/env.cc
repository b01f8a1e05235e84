#include "utils/temp/env/env.h"

#include <stdlib.h>

#include "utils/logging/logging.h"

namespace s3region::utils::temp
{

namespace
{

std::optional<std::string> current(const std::string & name)
{
    const char * const raw = ::getenv(name.c_str());
    return raw == nullptr ? std::nullopt : std::optional<std::string>(raw);
}

void restore(const std::string & name, const std::optional<std::string> & previous)
{
    const int result = previous.has_value() ?
        ::setenv(name.c_str(), previous.value().c_str(), 1) :
        ::unsetenv(name.c_str());

    if (result == -1)
    {
        LOG(ERROR) << "Failed restoring environment variable '" << name << "'";
    }
}

} // namespace

Env::Env(const std::string & value) : Env(random::string(), value)
{}

Env::Env(const std::string & name, const char * value) :
    name(name),
    value(value),
    _previous(current(name))
{
    PASSERT(::setenv(name.c_str(), value, 1) != -1) << "Failed setting environment variable '" << name << "' to \"" << value << "\"";
}

Env::Env(const std::string & name, const std::string & value) :
    Env(name, value.c_str())
{}

Env::Env(const std::string & name, int value) :
    Env(name, std::to_string(value))
{}

Env::Env(const std::string & name, unsigned long value) :
    Env(name, std::to_string(value))
{}

Env::Env(const std::string & name, bool value) :
    Env(name, static_cast<int>(value))
{}

Env::~Env()
{
    restore(name, _previous);
}

Unset::Unset(const std::string & name) :
    name(name),
    _previous(current(name))
{
    PASSERT(::unsetenv(name.c_str()) != -1) << "Failed unsetting environment variable '" << name << "'";
}

Unset::~Unset()
{
    restore(name, _previous);
}

} // namespace s3region::utils::temp
