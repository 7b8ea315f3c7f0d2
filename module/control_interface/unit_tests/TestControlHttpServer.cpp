/**
 * @file TestControlHttpServer.cpp
 *
 * @copyright Copyright (c) 2022 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include "ControlHttpServer.h"
#include "JsonSerializable.h"
#include "TestFileHelpers.h"
#include <string>

namespace http = boost::beast::http;
typedef http::response<http::string_body> test_response_t;

static test_response_t SendRequest(boost::asio::ip::tcp::socket & socket, http::verb method,
    const std::string & target, const std::string & body, bool keepAlive)
{
    http::request<http::string_body> req(method, target, 11);
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(keepAlive);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    test_response_t res;
    http::read(socket, buffer, res);
    return res;
}

static void ConnectLoopback(boost::asio::ip::tcp::socket & socket, uint16_t port) {
    socket.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
}

BOOST_AUTO_TEST_CASE(ControlHttpServerRequestsTestCase)
{
    ScopedTestDirectory dir("cftp_control_http");
    TransferServerConfig config;
    config.m_host = "127.0.0.1";
    config.m_port = 0;
    config.m_rootDir = dir.SubDirectory("root").string();
    config.m_tempDir = dir.SubDirectory("temp").string();
    config.m_serverType = "multiplexed";
    config.m_ioMode = "nonblocking";
    BOOST_REQUIRE(WriteTestFile(boost::filesystem::path(config.m_rootDir) / "hello.txt", MakeTestFileContents(1000, 1)));

    TransferServerController controller;
    DownloadManager downloadManager(dir.SubDirectory("save"), dir.SubDirectory("clienttemp"));
    ControlApi api(controller, downloadManager);
    ControlHttpServer httpServer;
    BOOST_REQUIRE(!httpServer.Init("not an address", 0, api));
    BOOST_REQUIRE(httpServer.Init("127.0.0.1", 0, api));
    const uint16_t httpPort = httpServer.GetBoundPort();
    BOOST_REQUIRE_NE(httpPort, 0);
    BOOST_REQUIRE(!httpServer.Init("127.0.0.1", 0, api));

    boost::asio::io_service ioService;
    {
        //several requests on one keep-alive connection
        boost::asio::ip::tcp::socket socket(ioService);
        ConnectLoopback(socket, httpPort);

        test_response_t res = SendRequest(socket, http::verb::get, "/server/status", "", true);
        BOOST_REQUIRE_EQUAL(res.result_int(), 200);
        BOOST_REQUIRE_EQUAL(std::string(res[http::field::content_type]), "application/json");
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(res.body(), pt));
        BOOST_REQUIRE(!pt.get<bool>("running"));

        res = SendRequest(socket, http::verb::post, "/server/start", config.ToJson(), true);
        BOOST_REQUIRE_EQUAL(res.result_int(), 200);
        BOOST_REQUIRE(controller.IsRunning());

        res = SendRequest(socket, http::verb::get, "/files", "", true);
        BOOST_REQUIRE_EQUAL(res.result_int(), 200);
        BOOST_REQUIRE_NE(res.body().find("hello.txt"), std::string::npos);

        res = SendRequest(socket, http::verb::delete_, "/files", "", true);
        BOOST_REQUIRE_EQUAL(res.result_int(), 405);

        res = SendRequest(socket, http::verb::get, "/missing", "", false);
        BOOST_REQUIRE_EQUAL(res.result_int(), 404);
        BOOST_REQUIRE(!res.keep_alive());
        boost::system::error_code ec;
        socket.close(ec);
    }
    {
        boost::asio::ip::tcp::socket socket(ioService);
        ConnectLoopback(socket, httpPort);
        const test_response_t res = SendRequest(socket, http::verb::post, "/server/stop", "", false);
        BOOST_REQUIRE_EQUAL(res.result_int(), 200);
        BOOST_REQUIRE(!controller.IsRunning());
    }

    //an idle connection must not keep Stop() from returning
    boost::asio::ip::tcp::socket idleSocket(ioService);
    ConnectLoopback(idleSocket, httpPort);
    httpServer.Stop();
    BOOST_REQUIRE_EQUAL(httpServer.GetBoundPort(), 0);
    boost::asio::ip::tcp::socket refusedSocket(ioService);
    boost::system::error_code ec;
    refusedSocket.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), httpPort), ec);
    BOOST_REQUIRE(ec);

    //restart on a fresh port
    BOOST_REQUIRE(httpServer.Init("127.0.0.1", 0, api));
    BOOST_REQUIRE_NE(httpServer.GetBoundPort(), 0);
    httpServer.Stop();
}
