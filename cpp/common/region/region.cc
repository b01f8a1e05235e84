#include "common/region/region.h"

#include <array>
#include <utility>

#include "utils/logging/logging.h"

namespace s3region::common
{

namespace
{

struct Entry
{
    Region::Known known;
    std::string_view name;
    std::string_view host;
};

// indexed by `Region::Known`
constexpr std::array<Entry, static_cast<size_t>(Region::Known::__Max)> __table = {{
    // us-east-1 has no s3-us-east-1.amazonaws.com DNS record
    { Region::Known::UsEast1,      "us-east-1",      "s3.amazonaws.com"                },
    { Region::Known::UsEast2,      "us-east-2",      "s3-us-east-2.amazonaws.com"      },
    { Region::Known::UsWest1,      "us-west-1",      "s3-us-west-1.amazonaws.com"      },
    { Region::Known::UsWest2,      "us-west-2",      "s3-us-west-2.amazonaws.com"      },
    { Region::Known::CaCentral1,   "ca-central-1",   "s3-ca-central-1.amazonaws.com"   },
    { Region::Known::ApSouth1,     "ap-south-1",     "s3-ap-south-1.amazonaws.com"     },
    { Region::Known::ApNortheast1, "ap-northeast-1", "s3-ap-northeast-1.amazonaws.com" },
    { Region::Known::ApNortheast2, "ap-northeast-2", "s3-ap-northeast-2.amazonaws.com" },
    { Region::Known::ApSoutheast1, "ap-southeast-1", "s3-ap-southeast-1.amazonaws.com" },
    { Region::Known::ApSoutheast2, "ap-southeast-2", "s3-ap-southeast-2.amazonaws.com" },
    { Region::Known::EuCentral1,   "eu-central-1",   "s3-eu-central-1.amazonaws.com"   },
    { Region::Known::EuWest1,      "eu-west-1",      "s3-eu-west-1.amazonaws.com"      },
    { Region::Known::EuWest2,      "eu-west-2",      "s3-eu-west-2.amazonaws.com"      },
    { Region::Known::EuWest3,      "eu-west-3",      "s3-eu-west-3.amazonaws.com"      },
    { Region::Known::SaEast1,      "sa-east-1",      "s3-sa-east-1.amazonaws.com"      },
    { Region::Known::DoNyc3,       "nyc3",           "nyc3.digitaloceanspaces.com"     },
    { Region::Known::DoAms3,       "ams3",           "ams3.digitaloceanspaces.com"     },
    { Region::Known::DoSgp1,       "sgp1",           "sgp1.digitaloceanspaces.com"     },
}};

constexpr bool table_is_ordered()
{
    for (size_t i = 0; i < __table.size(); ++i)
    {
        if (static_cast<size_t>(__table[i].known) != i)
        {
            return false;
        }
    }
    return true;
}

static_assert(table_is_ordered(), "region table must be ordered by Region::Known");

const Entry & entry(Region::Known known)
{
    return __table.at(static_cast<size_t>(known));
}

constexpr std::string_view SchemeSeparator = "://";
constexpr std::string_view DefaultScheme = "https";
constexpr std::string_view CustomName = "custom";

} // namespace

Region::Region(Known known) : _region(known)
{
    ASSERT(known < Known::__Max) << "Invalid known region " << static_cast<int>(known);
}

Region::Region(Custom custom) : _region(std::move(custom))
{}

Region Region::parse(const std::string & name)
{
    for (const auto & e : __table)
    {
        if (e.name == name)
        {
            return Region(e.known);
        }
    }

    LOG(SPAM) << "'" << name << "' is not a known region; using it as a custom endpoint";
    return Region(Custom{name});
}

const std::vector<Region::Known> & Region::known()
{
    static const std::vector<Known> __known = [](){
        std::vector<Known> result;
        for (const auto & e : __table)
        {
            result.push_back(e.known);
        }
        return result;
    }();

    return __known;
}

bool Region::is_custom() const
{
    return std::holds_alternative<Custom>(_region);
}

std::string_view Region::name() const
{
    if (is_custom())
    {
        return CustomName;
    }

    return entry(std::get<Known>(_region)).name;
}

std::string_view Region::endpoint() const
{
    if (is_custom())
    {
        return std::get<Custom>(_region).value;
    }

    return entry(std::get<Known>(_region)).host;
}

std::string_view Region::scheme() const
{
    if (!is_custom())
    {
        return DefaultScheme;
    }

    const std::string_view value = std::get<Custom>(_region).value;
    const auto pos = value.find(SchemeSeparator);

    return pos == std::string_view::npos ? DefaultScheme : value.substr(0, pos);
}

std::string_view Region::host() const
{
    if (!is_custom())
    {
        return endpoint();
    }

    const std::string_view value = std::get<Custom>(_region).value;
    const auto pos = value.find(SchemeSeparator);

    return pos == std::string_view::npos ? value : value.substr(pos + SchemeSeparator.size());
}

bool operator==(const Region & a, const Region & b)
{
    if (a.is_custom() != b.is_custom())
    {
        return false;
    }

    if (a.is_custom())
    {
        return std::get<Region::Custom>(a._region).value == std::get<Region::Custom>(b._region).value;
    }

    return std::get<Region::Known>(a._region) == std::get<Region::Known>(b._region);
}

bool operator!=(const Region & a, const Region & b)
{
    return !(a == b);
}

std::ostream & operator<<(std::ostream & os, const Region & region)
{
    return os << region.name();
}

std::ostream & operator<<(std::ostream & os, const Region::Known & known)
{
    return os << Region(known);
}

}; // namespace s3region::common
