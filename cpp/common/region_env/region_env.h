#pragma once

#include "common/region/region.h"

namespace s3region::common
{

// first set of AWS_ENDPOINT_URL, AWS_REGION and AWS_DEFAULT_REGION, or us-east-1 if none is set
Region region_from_env();

}; // namespace s3region::common
