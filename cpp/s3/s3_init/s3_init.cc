#include "s3/s3_init/s3_init.h"

#include "utils/env/env.h"
#include "utils/logging/logging.h"

namespace s3region::s3
{

S3Init::S3Init()
{
    options.httpOptions.installSigPipeHandler = true;

    if (utils::getenv<bool>("S3REGION_S3_TRACE", false))
    {
        // the sdk writes its trace logs to a file of its own
        options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Trace;
    }

    LOG(DEBUG) << "Initializing AWS SDK";
    Aws::InitAPI(options);
}

S3Init::~S3Init()
{
    LOG(DEBUG) << "Shutting down AWS SDK";
    try
    {
        Aws::ShutdownAPI(options);
    }
    catch (const std::exception & e)
    {
        LOG(ERROR) << "Caught exception while shutting down AWS SDK: " << e.what();
    }
}

}; // namespace s3region::s3
