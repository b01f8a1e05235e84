#pragma once

#include <string>
#include <vector>

namespace s3region::utils::random
{

// number

unsigned number(); // [1, 1000)
unsigned number(unsigned max); // [0, max)
unsigned number(unsigned min, unsigned max); // [min, max)

// the desired type is returned but the value is always a non-negative integer
template <typename T, typename... Args>
T number(Args ... args)
{
    return static_cast<T>(number(args...));
}

// string

// alphanumeric characters only
std::string string(unsigned length = number(15, 20));

std::vector<std::string> strings(unsigned count = number(10, 100));

// boolean

bool boolean();

// choice

template <typename T>
const T & choice(const std::vector<T> & options)
{
    return options.at(number(options.size()));
}

} // namespace s3region::utils::random
