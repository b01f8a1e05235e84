#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace s3region::common
{

// An object storage region: either one of the tabulated known regions, or a custom endpoint.
//
// A custom endpoint is either a bare host ("minio.local:9000") or an origin that includes
// a scheme ("http://minio.local:9000"); it is kept verbatim and split on demand.
//
//     auto region = Region::parse("us-east-1");   // Region::Known::UsEast1
//     Region other = Region::Known::EuWest2;

struct Region
{
    enum class Known
    {
        UsEast1,
        UsEast2,
        UsWest1,
        UsWest2,
        CaCentral1,
        ApSouth1,
        ApNortheast1,
        ApNortheast2,
        ApSoutheast1,
        ApSoutheast2,
        EuCentral1,
        EuWest1,
        EuWest2,
        EuWest3,
        SaEast1,
        DoNyc3, // DigitalOcean Spaces
        DoAms3, // DigitalOcean Spaces
        DoSgp1, // DigitalOcean Spaces
        __Max,
    };

    Region(Known known);

    // never fails; a string that is not a known region name (case sensitive) becomes a custom region
    static Region parse(const std::string & name);

    // all known regions, in table order
    static const std::vector<Known> & known();

    bool is_custom() const;

    // the known region name, or "custom" for any custom region
    std::string_view name() const;

    // the default host of a known region, or the custom value as is (scheme included, if any)
    std::string_view endpoint() const;

    // "https" unless a custom value carries another scheme before "://"
    std::string_view scheme() const;

    // the endpoint without a leading "<scheme>://"
    std::string_view host() const;

    friend bool operator==(const Region &, const Region &);

 private:
    struct Custom
    {
        std::string value;
    };

    Region(Custom custom);

    std::variant<Known, Custom> _region;
};

bool operator==(const Region &, const Region &);
bool operator!=(const Region &, const Region &);

std::ostream & operator<<(std::ostream &, const Region &);
std::ostream & operator<<(std::ostream &, const Region::Known &);

}; // namespace s3region::common
