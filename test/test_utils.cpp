/*
 * Unit tests for src/utils.cpp
 */

#include "utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Url, Parse)
{
    utils::url parsed = utils::parse_url("http://10.0.0.5:8008/dd.xml");
    EXPECT_EQ("http", parsed.scheme);
    EXPECT_EQ("10.0.0.5", parsed.host);
    EXPECT_EQ(8008, parsed.port);
    EXPECT_EQ("/dd.xml", parsed.path);
    EXPECT_EQ("10.0.0.5:8008", parsed.authority());
    EXPECT_EQ("http://10.0.0.5:8008/dd.xml", parsed.to_string());
}

TEST(Url, Defaults)
{
    utils::url parsed = utils::parse_url("HTTP://example.com");
    EXPECT_EQ("http", parsed.scheme);
    EXPECT_EQ(80, parsed.port);
    EXPECT_EQ("/", parsed.path);
    EXPECT_EQ("http://example.com/", parsed.to_string());

    parsed = utils::parse_url("http://example.com?x=1#frag");
    EXPECT_EQ("/?x=1", parsed.path);
}

TEST(Url, Invalid)
{
    EXPECT_THROW(utils::parse_url("10.0.0.5:8008/dd.xml"), std::invalid_argument);
    EXPECT_THROW(utils::parse_url("ftp://10.0.0.5/"), std::invalid_argument);
    EXPECT_THROW(utils::parse_url("http:///dd.xml"), std::invalid_argument);
    EXPECT_THROW(utils::parse_url("http://10.0.0.5:99999/"), std::invalid_argument);
    EXPECT_THROW(utils::parse_url("http://10.0.0.5:80x/"), std::invalid_argument);
    EXPECT_FALSE(utils::is_absolute_url("/apps/"));
    EXPECT_TRUE(utils::is_absolute_url("http://10.0.0.5:8008/apps/"));
}

TEST(Url, Resolve)
{
    EXPECT_EQ("http://10.0.0.5:8008/apps/",
              utils::resolve_url("http://10.0.0.5:8008/dd.xml", "/apps/"));
    EXPECT_EQ("http://10.0.0.5:8008/ssdp/apps",
              utils::resolve_url("http://10.0.0.5:8008/ssdp/dd.xml", "apps"));
    EXPECT_EQ("http://10.0.0.5:8008/a/apps/",
              utils::resolve_url("http://10.0.0.5:8008/a/b/dd.xml", "../apps/"));
    EXPECT_EQ("http://10.0.0.5:8008/apps/YouTube/run",
              utils::resolve_url("http://10.0.0.5:8008/apps/YouTube/", "./run"));
    EXPECT_EQ("http://10.0.0.6/apps/",
              utils::resolve_url("http://10.0.0.5:8008/dd.xml", "http://10.0.0.6/apps/"));
    EXPECT_EQ("http://10.0.0.7:80/x",
              utils::resolve_url("http://10.0.0.5:8008/dd.xml", "//10.0.0.7:80/x"));
    EXPECT_THROW(utils::resolve_url("/relative/base", "apps"), std::invalid_argument);
}

TEST(Strings, TrimAndCompare)
{
    EXPECT_EQ("value", utils::trim("  value\r\n"));
    EXPECT_EQ("", utils::trim(" \t "));
    EXPECT_TRUE(utils::iequals("Application-URL", "APPLICATION-url"));
    EXPECT_FALSE(utils::iequals("LOCATION", "LOCATIONS"));
}

TEST(Strings, HeaderMapIgnoresCase)
{
    utils::header_map headers;
    headers["Location"] = "http://10.0.0.5:8008/dd.xml";
    headers["LOCATION"] = "http://10.0.0.6:8008/dd.xml";

    EXPECT_EQ(1u, headers.size());
    EXPECT_EQ("http://10.0.0.6:8008/dd.xml", headers.at("location"));
}
