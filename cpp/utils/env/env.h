#pragma once

#include <string>

namespace s3region::utils
{

// returns false if `variable` is not set; throws if it is set but cannot be parsed as `T`

template <typename T = std::string>
bool try_getenv(const std::string & variable, /* out */ T & value);

template <>
bool try_getenv(const std::string & variable, /* out */ std::string & value);

template <>
bool try_getenv(const std::string & variable, /* out */ int & value);

template <>
bool try_getenv(const std::string & variable, /* out */ unsigned long & value);

template <>
bool try_getenv(const std::string & variable, /* out */ bool & value);

bool env_exists(const std::string & variable);

// throws if `variable` is not set

template <typename T = std::string>
T getenv(const std::string & variable);

template <>
std::string getenv<std::string>(const std::string & variable);

template <>
int getenv<int>(const std::string & variable);

template <>
unsigned long getenv<unsigned long>(const std::string & variable);

template <>
bool getenv<bool>(const std::string & variable);

// returns `def` if `variable` is not set

template <typename T = std::string>
T getenv(const std::string & variable, T def);

template <>
std::string getenv<std::string>(const std::string & variable, std::string def);

template <>
int getenv<int>(const std::string & variable, int def);

template <>
unsigned long getenv<unsigned long>(const std::string & variable, unsigned long def);

template <>
bool getenv<bool>(const std::string & variable, bool def);

} // namespace s3region::utils
