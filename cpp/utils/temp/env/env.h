#pragma once

#include <optional>
#include <string>

#include "utils/random/random.h"

namespace s3region::utils::temp
{

// sets an environment variable for the lifetime of the object
// a previous value of the variable is restored upon destruction

struct Env
{
    Env(const std::string & value = random::string());

    Env(
        const std::string & name,
        const char * value);

    Env(
        const std::string & name,
        const std::string & value);

    Env(
        const std::string & name,
        int value);

    Env(
        const std::string & name,
        unsigned long value);

    Env(
        const std::string & name,
        bool value);

    ~Env();

    Env(Env &&) = delete;
    Env(const Env &) = delete;

    Env & operator=(Env &&) = delete;
    Env & operator=(const Env &) = delete;

    const std::string name;
    const std::string value;

 private:
    std::optional<std::string> _previous;
};

// removes an environment variable for the lifetime of the object

struct Unset
{
    Unset(const std::string & name);
    ~Unset();

    Unset(Unset &&) = delete;
    Unset(const Unset &) = delete;

    Unset & operator=(Unset &&) = delete;
    Unset & operator=(const Unset &) = delete;

    const std::string name;

 private:
    std::optional<std::string> _previous;
};

} // namespace s3region::utils::temp
