/*
 * Unit tests for the DIAL application client
 */

#include "dial_app.hpp"
#include "errors.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>


using namespace std::chrono_literals;

static const std::string app_url = "http://10.0.0.5:8008/apps/YouTube";
static const std::string status_url = app_url + "?clientDialVer=2.2";
static const std::string run_url = app_url + "/run";

static std::string status_document(const std::string& state, bool with_link = false, const std::string& allow_stop = "true")
{
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                      "<service xmlns=\"urn:dial-multiscreen-org:schemas:dial\" dialVer=\"2.2\">\r\n"
                      "  <name>YouTube</name>\r\n";
    if(!allow_stop.empty())
        xml += "  <options allowStop=\"" + allow_stop + "\"/>\r\n";
    xml += "  <state>" + state + "</state>";
    if(with_link)
        xml += "\r\n  <link rel=\"run\" href=\"run\"/>";
    xml += "\r\n  <additionalData><screenId>42</screenId><theme>dark</theme></additionalData>\r\n</service>\r\n";
    return xml;
}

static upnp::dial_device make_dial_device()
{
    discovery::discovered_device device;
    device.usn = "uuid:abc::urn:dial-multiscreen-org:service:dial:1";
    device.location = "http://10.0.0.5:8008/dd.xml";
    return upnp::dial_device {device, "Living Room TV", "http://10.0.0.5:8008/apps/", "", "", "uuid:abc"};
}

TEST(DialState, Parse)
{
    EXPECT_EQ(dial::app_state::stopped, dial::parse_state("stopped"));
    EXPECT_EQ(dial::app_state::running, dial::parse_state(" Running "));
    EXPECT_EQ(dial::app_state::starting, dial::parse_state("starting"));
    EXPECT_EQ(dial::app_state::stopping, dial::parse_state("stopping"));
    EXPECT_EQ(dial::app_state::hidden, dial::parse_state("hidden"));
    EXPECT_EQ(dial::app_state::unknown, dial::parse_state("installable=http://store.example.com/app"));
    EXPECT_STREQ("running", dial::to_string(dial::app_state::running));
}

TEST(DialStatus, ParseRunning)
{
    dial::application_instance instance = dial::parse_status("YouTube", status_document("running", true, "false"), app_url);
    EXPECT_EQ("YouTube", instance.name);
    EXPECT_EQ(dial::app_state::running, instance.state);
    EXPECT_EQ(run_url, instance.instance_url);
    EXPECT_EQ(false, instance.allow_stop);
    EXPECT_EQ("2.2", instance.dial_version);
    ASSERT_EQ(2u, instance.additional_data.size());
    EXPECT_EQ("42", instance.additional_data.at("screenId"));
    EXPECT_EQ("dark", instance.additional_data.at("theme"));
}

TEST(DialStatus, ParseMinimal)
{
    dial::application_instance instance = dial::parse_status("YouTube", "<service><state>stopped</state></service>", app_url);
    EXPECT_EQ("YouTube", instance.name);
    EXPECT_EQ(dial::app_state::stopped, instance.state);
    EXPECT_FALSE(instance.instance_url.has_value());
    EXPECT_FALSE(instance.allow_stop.has_value());
    EXPECT_TRUE(instance.additional_data.empty());
}

TEST(DialStatus, AbsoluteLink)
{
    dial::application_instance instance = dial::parse_status("YouTube",
        "<service><state>running</state><link rel=\"run\" href=\"http://10.0.0.5:8008/instances/7\"/></service>", app_url);
    EXPECT_EQ("http://10.0.0.5:8008/instances/7", instance.instance_url);
}

TEST(DialStatus, Malformed)
{
    EXPECT_THROW(dial::parse_status("YouTube", "", app_url), appcast::malformed_status);
    EXPECT_THROW(dial::parse_status("YouTube", "<service><state>running</service>", app_url), appcast::malformed_status);
    EXPECT_THROW(dial::parse_status("YouTube", "<service><name>YouTube</name></service>", app_url), appcast::malformed_status);
    EXPECT_THROW(dial::parse_status("YouTube", "not xml at all", app_url), appcast::malformed_status);
}

TEST(DialClient, Status)
{
    test::fake_http_client client;
    client.on("GET", status_url, test::make_response(200, status_document("running", true)));

    dial::app_client dial_client {client, make_dial_device()};
    dial::application_instance instance = dial_client.status("YouTube");
    EXPECT_EQ(dial::app_state::running, instance.state);
    EXPECT_EQ(run_url, instance.instance_url);

    ASSERT_EQ(1u, client.requests.size());
    EXPECT_EQ("GET", client.requests[0].method);
}

TEST(DialClient, StatusErrors)
{
    test::fake_http_client client;
    client.on("GET", status_url, test::make_response(200, "<html/>"));
    dial::app_client dial_client {client, make_dial_device()};

    EXPECT_THROW(dial_client.status("YouTube"), appcast::malformed_status);
    EXPECT_THROW(dial_client.status("Netflix"), appcast::app_not_installed);
    EXPECT_THROW(dial_client.status("You/Tube"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.launch(""), appcast::operation_not_supported);

    test::fake_http_client down;
    down.fail("GET", status_url);
    dial::app_client unreachable {down, make_dial_device()};
    EXPECT_THROW(unreachable.status("YouTube"), appcast::unreachable_device);
}

TEST(DialClient, Launch)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(201, {}, {{"LOCATION", run_url}}));

    dial::app_client dial_client {client, make_dial_device()};
    std::optional<std::string> instance = dial_client.launch("YouTube", std::string {"v=dQw4w9WgXcQ&t=42"});
    EXPECT_EQ(run_url, instance);

    ASSERT_EQ(1u, client.requests.size());
    EXPECT_EQ("POST", client.requests[0].method);
    EXPECT_EQ(app_url, client.requests[0].url);
    EXPECT_EQ("v=dQw4w9WgXcQ&t=42", client.requests[0].body);
    EXPECT_EQ("text/plain; charset=\"utf-8\"", client.requests[0].headers.at("Content-Type"));
}

TEST(DialClient, LaunchWithoutPayload)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(201));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_FALSE(dial_client.launch("YouTube").has_value());
    ASSERT_EQ(1u, client.requests.size());
    EXPECT_TRUE(client.requests[0].body.empty());
    EXPECT_EQ(0u, client.requests[0].headers.count("Content-Type"));
}

TEST(DialClient, LaunchErrors)
{
    test::fake_http_client client;
    client.on("POST", "http://10.0.0.5:8008/apps/Netflix", test::make_response(503));
    client.on("POST", "http://10.0.0.5:8008/apps/Big", test::make_response(413));
    client.fail("POST", app_url);

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.launch("Missing"), appcast::app_not_installed);
    EXPECT_THROW(dial_client.launch("Netflix"), appcast::device_busy);
    EXPECT_THROW(dial_client.launch("Big"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.launch("YouTube"), appcast::unreachable_device);
}

TEST(DialClient, LaunchErrorCodes)
{
    test::fake_http_client client;
    dial::app_client dial_client {client, make_dial_device()};

    // A held resource lock is answered with 500
    client.on("POST", app_url, test::make_response(500));
    EXPECT_THROW(dial_client.launch("YouTube"), appcast::device_busy);

    test::fake_http_client rejecting;
    rejecting.on("POST", app_url, test::make_response(400));
    rejecting.on("POST", "http://10.0.0.5:8008/apps/Netflix", test::make_response(401));
    dial::app_client rejected {rejecting, make_dial_device()};
    EXPECT_THROW(rejected.launch("YouTube", std::string {"bad payload"}), appcast::operation_not_supported);
    EXPECT_THROW(rejected.launch("Netflix"), appcast::operation_not_supported);

    test::fake_http_client broken;
    broken.on("POST", app_url, test::make_response(502));
    dial::app_client unreachable {broken, make_dial_device()};
    EXPECT_THROW(unreachable.launch("YouTube"), appcast::unreachable_device);
}

TEST(DialClient, StatusAndStopErrorCodes)
{
    test::fake_http_client client;
    client.on("GET", status_url, test::make_response(500));
    client.on("DELETE", run_url, test::make_response(500));
    client.on("DELETE", app_url + "/denied", test::make_response(401));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.status("YouTube"), appcast::device_busy);
    EXPECT_THROW(dial_client.stop("YouTube", run_url), appcast::device_busy);
    EXPECT_THROW(dial_client.stop("YouTube", app_url + "/denied"), appcast::operation_not_supported);
}

TEST(DialClient, LaunchThenPollUntilRunning)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(201, {}, {{"LOCATION", run_url}}));
    client.on("GET", status_url, test::make_response(200, status_document("stopped")));
    client.on("GET", status_url, test::make_response(200, status_document("starting")));
    client.on("GET", status_url, test::make_response(200, status_document("running", true)));

    dial::app_client dial_client {client, make_dial_device()};
    dial_client.launch("YouTube");

    dial::application_instance instance;
    for(int attempt = 0; attempt < 5 && instance.state != dial::app_state::running; attempt++)
        instance = dial_client.status("YouTube");

    EXPECT_EQ(dial::app_state::running, instance.state);
    EXPECT_EQ(run_url, instance.instance_url);
    EXPECT_EQ(3u, client.count("GET", status_url));
}

TEST(DialClient, Stop)
{
    test::fake_http_client client;
    client.on("DELETE", run_url, test::make_response(200));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_NO_THROW(dial_client.stop("YouTube", run_url));
    EXPECT_EQ(1u, client.count("DELETE", run_url));
}

TEST(DialClient, StopUnknownInstance)
{
    test::fake_http_client client;
    client.on("DELETE", run_url, test::make_response(200));
    client.on("DELETE", app_url + "/forbidden", test::make_response(403));
    client.on("DELETE", app_url + "/unsupported", test::make_response(501));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.stop("YouTube", app_url + "/other"), appcast::app_not_installed);
    EXPECT_THROW(dial_client.stop("YouTube", app_url + "/forbidden"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", app_url + "/unsupported"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", "run"), appcast::operation_not_supported);
}

TEST(DialClient, StopOutsideApplication)
{
    test::fake_http_client client;
    client.on("DELETE", "http://192.0.2.9/anything", test::make_response(200));
    client.on("DELETE", "http://10.0.0.5:8008/apps/Netflix/run", test::make_response(200));
    client.on("DELETE", "http://10.0.0.5:8008/apps/YouTubeKids/run", test::make_response(200));
    client.on("DELETE", "http://10.0.0.5:9000/apps/YouTube/run", test::make_response(200));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.stop("YouTube", "http://192.0.2.9/anything"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", "http://10.0.0.5:8008/apps/Netflix/run"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", "http://10.0.0.5:8008/apps/YouTubeKids/run"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", "http://10.0.0.5:9000/apps/YouTube/run"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.stop("YouTube", app_url), appcast::operation_not_supported);
    EXPECT_TRUE(client.requests.empty());
}

TEST(DialClient, Hide)
{
    test::fake_http_client client;
    client.on("POST", run_url + "/hide", test::make_response(200));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_NO_THROW(dial_client.hide("YouTube", run_url));
    EXPECT_NO_THROW(dial_client.hide("YouTube", run_url + "/"));
    EXPECT_EQ(2u, client.count("POST", run_url + "/hide"));
}

TEST(DialClient, HideErrors)
{
    test::fake_http_client client;
    client.on("POST", app_url + "/unsupported/hide", test::make_response(501));
    client.on("POST", app_url + "/locked/hide", test::make_response(500));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.hide("YouTube", run_url), appcast::app_not_installed);
    EXPECT_THROW(dial_client.hide("YouTube", app_url + "/unsupported"), appcast::operation_not_supported);
    EXPECT_THROW(dial_client.hide("YouTube", app_url + "/locked"), appcast::device_busy);
    EXPECT_THROW(dial_client.hide("YouTube", "http://192.0.2.9/run"), appcast::operation_not_supported);
    EXPECT_EQ(0u, client.count("POST", "http://192.0.2.9/run/hide"));
}

TEST(DialClient, SupportsStop)
{
    test::fake_http_client client;
    client.on("GET", status_url, test::make_response(200, status_document("running", true, "false")));
    client.on("GET", "http://10.0.0.5:8008/apps/Netflix?clientDialVer=2.2", test::make_response(200, status_document("running", true, "")));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_FALSE(dial_client.supports_stop("YouTube"));
    EXPECT_TRUE(dial_client.supports_stop("Netflix"));
    EXPECT_THROW(dial_client.supports_stop("Missing"), appcast::app_not_installed);
}

TEST(DialClient, RetriesBusyDevice)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(503));
    client.on("POST", app_url, test::make_response(503));
    client.on("POST", app_url, test::make_response(201));

    appcast::config cfg;
    cfg.retry.attempts = 3;
    cfg.retry.delay = 0ms;

    dial::app_client dial_client {client, make_dial_device(), cfg};
    EXPECT_NO_THROW(dial_client.launch("YouTube"));
    EXPECT_EQ(3u, client.count("POST", app_url));
}

TEST(DialClient, NoRetryByDefault)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(503));

    dial::app_client dial_client {client, make_dial_device()};
    EXPECT_THROW(dial_client.launch("YouTube"), appcast::device_busy);
    EXPECT_EQ(1u, client.count("POST", app_url));
}

TEST(DialClient, RetriesAreBounded)
{
    test::fake_http_client client;
    client.fail("GET", status_url, true);

    appcast::config cfg;
    cfg.retry.attempts = 2;
    cfg.retry.delay = 0ms;

    dial::app_client dial_client {client, make_dial_device(), cfg};
    EXPECT_THROW(dial_client.status("YouTube"), appcast::unreachable_device);
    EXPECT_EQ(2u, client.count("GET", status_url));
}

TEST(DialClient, RetriesLockedDevice)
{
    test::fake_http_client client;
    client.on("POST", app_url, test::make_response(500));
    client.on("POST", app_url, test::make_response(201));

    appcast::config cfg;
    cfg.retry.attempts = 2;
    cfg.retry.delay = 0ms;

    dial::app_client dial_client {client, make_dial_device(), cfg};
    EXPECT_NO_THROW(dial_client.launch("YouTube"));
    EXPECT_EQ(2u, client.count("POST", app_url));
}

TEST(DialClient, LaunchTimeoutIsNotRepeated)
{
    test::fake_http_client client;
    client.fail("POST", app_url, true);

    appcast::config cfg;
    cfg.retry.attempts = 3;
    cfg.retry.delay = 0ms;

    dial::app_client dial_client {client, make_dial_device(), cfg};
    EXPECT_THROW(dial_client.launch("YouTube"), appcast::unreachable_device);
    EXPECT_EQ(1u, client.count("POST", app_url));
}
