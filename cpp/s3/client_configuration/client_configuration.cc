#include "s3/client_configuration/client_configuration.h"

#include <aws/core/http/Scheme.h>

#include <strings.h>

#include <string>

#include "utils/env/env.h"
#include "utils/logging/logging.h"

namespace s3region::s3
{

ClientConfiguration::ClientConfiguration(const common::Region & region)
{
    if (region.is_custom())
    {
        const std::string scheme(region.scheme());
        const std::string endpoint = scheme + "://" + std::string(region.host());

        config.scheme = Aws::Http::SchemeMapper::FromString(scheme.c_str());
        config.endpointOverride = Aws::String(endpoint.c_str(), endpoint.size());

        CHECK(::strcasecmp(Aws::Http::SchemeMapper::ToString(config.scheme), scheme.c_str()) == 0) <<
            "Unsupported scheme '" << scheme << "' of endpoint " << endpoint << "; s3 requests will use " << Aws::Http::SchemeMapper::ToString(config.scheme);

        // S3 compatible services are mostly reachable with path style requests only
        config.useVirtualAddressing = false;

        LOG(DEBUG) << "Setting s3 endpoint to " << config.endpointOverride;
    }
    else
    {
        // the sdk resolves the endpoint of a known region by itself
        const auto name = region.name();
        config.region = Aws::String(name.data(), name.size());

        LOG(DEBUG) << "Setting s3 region to " << config.region;
    }

    if (utils::try_getenv("S3REGION_S3_USE_VIRTUAL_ADDRESSING", config.useVirtualAddressing))
    {
        LOG(DEBUG) << "Setting s3 configuration useVirtualAddressing to " << config.useVirtualAddressing;
    }
}

}; // namespace s3region::s3
