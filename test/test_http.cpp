/*
 * Unit tests for src/http/
 */

#include "http/request.hpp"
#include "http/response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(HttpRequest, Get)
{
    http::request req {"GET", "http://10.0.0.5:8008/apps/YouTube?clientDialVer=2.2"};
    EXPECT_EQ("GET /apps/YouTube?clientDialVer=2.2 HTTP/1.1\r\n"
              "Host: 10.0.0.5:8008\r\n"
              "Connection: close\r\n"
              "\r\n",
              req.to_string());
}

TEST(HttpRequest, PostWithBody)
{
    http::request req {"POST", "http://10.0.0.5:8008/apps/YouTube"};
    req.set_header("Content-Type", "text/plain");
    req.set_body("v=abc");

    const std::string raw = req.to_string();
    EXPECT_EQ(0u, raw.find("POST /apps/YouTube HTTP/1.1\r\n"));
    EXPECT_NE(std::string::npos, raw.find("Content-Type: text/plain\r\n"));
    EXPECT_NE(std::string::npos, raw.find("Content-Length: 5\r\n"));
    EXPECT_EQ(raw.size() - 9, raw.find("\r\n\r\nv=abc"));
}

TEST(HttpRequest, EmptyPostHasLength)
{
    http::request req {"POST", "http://10.0.0.5/apps/YouTube"};
    EXPECT_NE(std::string::npos, req.to_string().find("Content-Length: 0\r\n"));
    EXPECT_NE(std::string::npos, req.to_string().find("Host: 10.0.0.5\r\n"));
}

TEST(HttpRequest, Headers)
{
    http::request req {"POST", "http://10.0.0.5:8008/apps/YouTube"};
    req.set_header("Content-Type", "text/plain");

    EXPECT_TRUE(req.check_header("content-type"));
    EXPECT_EQ("text/plain", req.get_header("CONTENT-TYPE"));
    EXPECT_FALSE(req.check_header("Origin"));
    EXPECT_EQ("", req.get_header("Origin"));
}

TEST(HttpRequest, InvalidUrl)
{
    EXPECT_THROW((http::request {"GET", "/dd.xml"}), std::invalid_argument);
}

TEST(HttpResponse, Parse)
{
    http::response res {"HTTP/1.1 201 Created\r\n"
                        "LOCATION: http://10.0.0.5:8008/apps/YouTube/run\r\n"
                        "Content-Length: 0\r\n"
                        "\r\n"};
    EXPECT_EQ(201, res.get_code());
    EXPECT_EQ("Created", res.get_phrase());
    EXPECT_TRUE(res.success());
    EXPECT_TRUE(res.check_header("Location"));
    EXPECT_EQ("http://10.0.0.5:8008/apps/YouTube/run", res.get_header("location"));
    EXPECT_EQ("", res.get_header("Application-URL"));
    EXPECT_TRUE(res.get_body().empty());
}

TEST(HttpResponse, ContentLength)
{
    const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";
    EXPECT_EQ(raw.size(), http::response::message_size(raw));
    EXPECT_EQ(raw.size(), http::response::message_size(raw.substr(0, raw.size() - 2)));
    EXPECT_FALSE(http::response::message_size("HTTP/1.1 200 OK\r\nContent-").has_value());

    EXPECT_EQ("hello", http::response {raw}.get_body());
    EXPECT_THROW((http::response {raw.substr(0, raw.size() - 1)}), std::invalid_argument);
}

TEST(HttpResponse, Chunked)
{
    const std::string raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                            "4\r\n<ser\r\n3\r\nvic\r\n0\r\n\r\n";
    EXPECT_EQ(raw.size(), http::response::message_size(raw));
    EXPECT_FALSE(http::response::message_size(raw.substr(0, raw.size() - 4)).has_value());
    EXPECT_EQ("<servic", http::response {raw}.get_body());
}

TEST(HttpResponse, UntilClose)
{
    const std::string raw = "HTTP/1.0 200 OK\r\nContent-Type: text/xml\r\n\r\n<root/>";
    EXPECT_FALSE(http::response::message_size(raw).has_value());
    EXPECT_EQ("<root/>", http::response {raw}.get_body());

    const std::string no_content = "HTTP/1.1 204 No Content\r\n\r\n";
    EXPECT_EQ(no_content.size(), http::response::message_size(no_content));
}

TEST(HttpResponse, Invalid)
{
    EXPECT_THROW(http::response {"HTTP/1.1 200 OK\r\n"}, std::invalid_argument);
    EXPECT_THROW(http::response {"SIP/2.0 200 OK\r\n\r\n"}, std::invalid_argument);
    EXPECT_THROW(http::response {"HTTP/1.1 abc OK\r\n\r\n"}, std::invalid_argument);
    EXPECT_THROW(http::response {"HTTP/1.1 200 OK\r\nbroken header\r\n\r\n"}, std::invalid_argument);
}
