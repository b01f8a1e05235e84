#pragma once

#include <aws/core/Aws.h>
#include <aws/s3-crt/S3CrtClient.h>

#include "common/region/region.h"

namespace s3region::s3
{

// S3 CRT client configuration addressing the given region
// the AWS SDK must be initialized (see S3Init) before creating one
struct ClientConfiguration
{
    ClientConfiguration(const common::Region & region);

    Aws::S3Crt::ClientConfiguration config;
};

}; // namespace s3region::s3
