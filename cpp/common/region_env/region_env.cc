#include "common/region_env/region_env.h"

#include <string>

#include "utils/env/env.h"
#include "utils/logging/logging.h"

namespace s3region::common
{

Region region_from_env()
{
    // an explicit endpoint takes precedence over a region name
    for (const auto variable : { "AWS_ENDPOINT_URL", "AWS_REGION", "AWS_DEFAULT_REGION" })
    {
        std::string value;
        if (utils::try_getenv(variable, /* out */ value))
        {
            LOG(DEBUG) << "Using region '" << value << "' from " << variable;
            return Region::parse(value);
        }
    }

    const Region region(Region::Known::UsEast1);
    LOG(DEBUG) << "Region is not configured; using default region " << region;
    return region;
}

}; // namespace s3region::common
