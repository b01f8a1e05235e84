#include "utils/random/random.h"

#include <stdlib.h>

#include <algorithm>

#include "utils/logging/logging.h"

namespace s3region::utils::random
{

unsigned number()
{
    return number(1, 1000);
}

unsigned number(unsigned max)
{
    return number(0, max);
}

unsigned number(unsigned min, unsigned max)
{
    if (min == max)
    {
        return min;
    }

    ASSERT(min < max) << "Invalid random range [" << min << ", " << max << ")";

    return (::rand() % (max - min)) + min;
}

std::string string(unsigned length)
{
    static const char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";

    std::string result(length, 0);
    std::generate_n(result.begin(), length, [](){ return charset[number(sizeof(charset) - 1)]; });

    return result;
}

std::vector<std::string> strings(unsigned count)
{
    std::vector<std::string> result(count);
    std::generate(result.begin(), result.end(), [](){ return string(); });
    return result;
}

bool boolean()
{
    return number(2) == 1;
}

} // namespace s3region::utils::random
