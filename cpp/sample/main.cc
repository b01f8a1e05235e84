#include <iostream>
#include <string>

#include "common/region/region.h"
#include "common/region_env/region_env.h"

#include "utils/logging/logging.h"

int main(int argc, char *argv[])
{
    if (argc > 2)
    {
        std::cerr << "Usage: " << argv[0] << " [region name or endpoint]" << std::endl;
        return 1;
    }

    const auto region = argc == 2 ?
        s3region::common::Region::parse(argv[1]) :
        s3region::common::region_from_env();

    LOG(INFO) << "Resolved region " << region;

    std::cout << "name: " << region.name() << std::endl;
    std::cout << "endpoint: " << region.endpoint() << std::endl;
    std::cout << "scheme: " << region.scheme() << std::endl;
    std::cout << "host: " << region.host() << std::endl;

    return 0;
}
