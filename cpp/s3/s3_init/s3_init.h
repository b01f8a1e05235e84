#pragma once

#include <aws/core/Aws.h>

namespace s3region::s3
{

// initializes the AWS SDK for its lifetime
struct S3Init
{
    S3Init();
    ~S3Init();

    S3Init(const S3Init &) = delete;
    S3Init & operator=(const S3Init &) = delete;

    Aws::SDKOptions options;
};

}; // namespace s3region::s3
