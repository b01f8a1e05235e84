#include "common/region/region.h"

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include "utils/random/random.h"

namespace s3region::common
{

namespace
{

using Known = Region::Known;

const std::vector<std::tuple<Known, std::string, std::string>> __expected = {
    { Known::UsEast1,      "us-east-1",      "s3.amazonaws.com"                },
    { Known::UsEast2,      "us-east-2",      "s3-us-east-2.amazonaws.com"      },
    { Known::UsWest1,      "us-west-1",      "s3-us-west-1.amazonaws.com"      },
    { Known::UsWest2,      "us-west-2",      "s3-us-west-2.amazonaws.com"      },
    { Known::CaCentral1,   "ca-central-1",   "s3-ca-central-1.amazonaws.com"   },
    { Known::ApSouth1,     "ap-south-1",     "s3-ap-south-1.amazonaws.com"     },
    { Known::ApNortheast1, "ap-northeast-1", "s3-ap-northeast-1.amazonaws.com" },
    { Known::ApNortheast2, "ap-northeast-2", "s3-ap-northeast-2.amazonaws.com" },
    { Known::ApSoutheast1, "ap-southeast-1", "s3-ap-southeast-1.amazonaws.com" },
    { Known::ApSoutheast2, "ap-southeast-2", "s3-ap-southeast-2.amazonaws.com" },
    { Known::EuCentral1,   "eu-central-1",   "s3-eu-central-1.amazonaws.com"   },
    { Known::EuWest1,      "eu-west-1",      "s3-eu-west-1.amazonaws.com"      },
    { Known::EuWest2,      "eu-west-2",      "s3-eu-west-2.amazonaws.com"      },
    { Known::EuWest3,      "eu-west-3",      "s3-eu-west-3.amazonaws.com"      },
    { Known::SaEast1,      "sa-east-1",      "s3-sa-east-1.amazonaws.com"      },
    { Known::DoNyc3,       "nyc3",           "nyc3.digitaloceanspaces.com"     },
    { Known::DoAms3,       "ams3",           "ams3.digitaloceanspaces.com"     },
    { Known::DoSgp1,       "sgp1",           "sgp1.digitaloceanspaces.com"     },
};

} // namespace

TEST(Known, Table)
{
    ASSERT_EQ(Region::known().size(), __expected.size());

    for (const auto & [known, name, host] : __expected)
    {
        const Region region(known);

        EXPECT_FALSE(region.is_custom());
        EXPECT_EQ(region.name(), name);
        EXPECT_EQ(region.endpoint(), host);
    }
}

TEST(Known, Invalid)
{
    EXPECT_THROW({ const Region region(Known::__Max); }, std::exception);
}

TEST(Known, Order)
{
    for (size_t i = 0; i < __expected.size(); ++i)
    {
        EXPECT_EQ(Region::known().at(i), std::get<0>(__expected.at(i)));
    }
}

TEST(Known, Unique_Names)
{
    std::set<std::string> names;
    for (auto known : Region::known())
    {
        EXPECT_TRUE(names.insert(std::string(Region(known).name())).second) << known;
    }
}

TEST(Known, Round_Trip)
{
    for (auto known : Region::known())
    {
        const Region region(known);
        const auto parsed = Region::parse(std::string(region.name()));

        EXPECT_EQ(parsed, region);
        EXPECT_FALSE(parsed.is_custom());
    }
}

TEST(Known, Host_Is_Endpoint)
{
    for (auto known : Region::known())
    {
        const Region region(known);
        EXPECT_EQ(region.host(), region.endpoint());
    }
}

TEST(Known, Https)
{
    for (auto known : Region::known())
    {
        EXPECT_EQ(Region(known).scheme(), "https");
    }
}

TEST(Parse, Known)
{
    for (const auto & [known, name, host] : __expected)
    {
        EXPECT_EQ(Region::parse(name), Region(known));
    }
}

TEST(Parse, Case_Sensitive)
{
    const auto region = Region::parse("US-EAST-1");

    EXPECT_TRUE(region.is_custom());
    EXPECT_NE(region, Region(Known::UsEast1));
    EXPECT_EQ(region.endpoint(), "US-EAST-1");
}

TEST(Parse, Whitespace_Is_Not_Trimmed)
{
    for (const std::string name : { " us-east-1", "us-east-1 ", "us-east-1\n" })
    {
        const auto region = Region::parse(name);

        EXPECT_TRUE(region.is_custom());
        EXPECT_EQ(region.endpoint(), name);
    }
}

TEST(Parse, Host_Is_Not_A_Name)
{
    const auto region = Region::parse("s3.amazonaws.com");

    EXPECT_TRUE(region.is_custom());
    EXPECT_NE(region, Region(Known::UsEast1));
    EXPECT_EQ(region.host(), Region(Known::UsEast1).host());
}

TEST(Custom, Unknown_Name)
{
    const auto region = Region::parse("not-a-real-region");

    EXPECT_TRUE(region.is_custom());
    EXPECT_EQ(region.name(), "custom");
    EXPECT_EQ(region.endpoint(), "not-a-real-region");
    EXPECT_EQ(region.scheme(), "https");
    EXPECT_EQ(region.host(), "not-a-real-region");
}

TEST(Custom, With_Scheme)
{
    const auto region = Region::parse("http://minio.local:9000");

    EXPECT_TRUE(region.is_custom());
    EXPECT_EQ(region.scheme(), "http");
    EXPECT_EQ(region.host(), "minio.local:9000");

    // the endpoint keeps the scheme
    EXPECT_EQ(region.endpoint(), "http://minio.local:9000");
}

TEST(Custom, Without_Scheme)
{
    const auto region = Region::parse("minio.local:9000");

    EXPECT_TRUE(region.is_custom());
    EXPECT_EQ(region.scheme(), "https");
    EXPECT_EQ(region.host(), "minio.local:9000");
    EXPECT_EQ(region.endpoint(), "minio.local:9000");
}

TEST(Custom, Https_Scheme)
{
    const auto host = utils::random::string() + ".example.com";
    const auto region = Region::parse("https://" + host);

    EXPECT_EQ(region.scheme(), "https");
    EXPECT_EQ(region.host(), host);
}

TEST(Custom, First_Separator)
{
    const auto region = Region::parse("a://b://c");

    EXPECT_EQ(region.scheme(), "a");
    EXPECT_EQ(region.host(), "b://c");
}

TEST(Custom, Empty_Scheme)
{
    const auto region = Region::parse("://host");

    EXPECT_EQ(region.scheme(), "");
    EXPECT_EQ(region.host(), "host");
}

TEST(Custom, Empty_Host)
{
    const auto region = Region::parse("http://");

    EXPECT_EQ(region.scheme(), "http");
    EXPECT_EQ(region.host(), "");
}

TEST(Custom, Empty)
{
    const auto region = Region::parse("");

    EXPECT_TRUE(region.is_custom());
    EXPECT_EQ(region.name(), "custom");
    EXPECT_EQ(region.endpoint(), "");
    EXPECT_EQ(region.scheme(), "https");
    EXPECT_EQ(region.host(), "");
}

TEST(Custom, Name)
{
    for (const auto & value : utils::random::strings())
    {
        for (const auto & prefix : { "", "http://", "https://" })
        {
            EXPECT_EQ(Region::parse(prefix + value).name(), "custom");
        }
    }
}

TEST(Custom, Host_Is_A_View_Of_The_Endpoint)
{
    const auto region = Region::parse("http://" + utils::random::string());

    const auto endpoint = region.endpoint();
    const auto host = region.host();

    EXPECT_EQ(host.data(), endpoint.data() + std::string("http://").size());
    EXPECT_EQ(host.data() + host.size(), endpoint.data() + endpoint.size());
}

TEST(Custom, Copy)
{
    const auto value = "http://" + utils::random::string();
    const auto region = Region::parse(value);
    const Region copy = region;

    EXPECT_EQ(copy, region);
    EXPECT_EQ(copy.endpoint(), value);
    EXPECT_NE(copy.endpoint().data(), region.endpoint().data());
}

TEST(Equality, Custom)
{
    const auto value = utils::random::string();

    EXPECT_EQ(Region::parse(value), Region::parse(value));
    EXPECT_NE(Region::parse(value), Region::parse(value + "x"));
    EXPECT_NE(Region::parse(value), Region::parse("http://" + value));
}

TEST(Equality, Known)
{
    for (auto a : Region::known())
    {
        for (auto b : Region::known())
        {
            EXPECT_EQ(Region(a) == Region(b), a == b);
            EXPECT_EQ(Region(a) != Region(b), a != b);
        }
    }
}

TEST(Stream, Sanity)
{
    {
        std::stringstream ss;
        ss << Region(Known::EuWest2);
        EXPECT_EQ(ss.str(), "eu-west-2");
    }

    {
        std::stringstream ss;
        ss << Known::DoAms3;
        EXPECT_EQ(ss.str(), "ams3");
    }

    {
        std::stringstream ss;
        ss << Region::parse("http://" + utils::random::string());
        EXPECT_EQ(ss.str(), "custom");
    }
}

}; // namespace s3region::common
