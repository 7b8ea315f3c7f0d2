/**
 * @file ControlHttpServer.cpp
 *
 * @copyright Copyright © 2022 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "ControlHttpServer.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>
#include <boost/optional.hpp>
#include <boost/thread.hpp>
#include <atomic>
#include <set>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::control;

static constexpr std::size_t MAX_REQUEST_BODY_BYTES = 65536;

typedef boost::beast::http::response<boost::beast::http::string_body> string_response_t;

class ControlHttpSession;
typedef std::set<std::shared_ptr<ControlHttpSession> > session_set_t;

static void PrintFail(boost::beast::error_code ec, const char * what) {
    LOG_ERROR(subprocess) << what << ": " << ec.message();
}

// One HTTP/1.1 connection; requests are answered in order, one at a time.
// The session set is only touched from the io_service thread.
class ControlHttpSession : public std::enable_shared_from_this<ControlHttpSession> {
public:
    ControlHttpSession(boost::asio::ip::tcp::socket && tcpSocket, ControlApi & controlApi, session_set_t & sessions) :
        m_tcpSocket(std::move(tcpSocket)),
        m_controlApiRef(controlApi),
        m_sessionsRef(sessions) {}

    void run() {
        m_sessionsRef.insert(shared_from_this());
        AsyncReadRequestFromRemoteClient();
    }

    void Close() {
        boost::beast::error_code ec;
        m_tcpSocket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        m_tcpSocket.close(ec);
    }

private:
    void AsyncReadRequestFromRemoteClient() {
        // Construct a new parser for each message
        m_requestParser.emplace();
        m_requestParser->body_limit(MAX_REQUEST_BODY_BYTES);
        boost::beast::http::async_read(
            m_tcpSocket,
            m_flatBuffer,
            *m_requestParser,
            boost::bind(
                &ControlHttpSession::HandleReadRequestFromRemoteClientCompleted,
                shared_from_this(),
                boost::placeholders::_1,
                boost::placeholders::_2));
    }

    void HandleReadRequestFromRemoteClientCompleted(boost::beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (ec) {
            if ((ec != boost::beast::http::error::end_of_stream) && (ec != boost::asio::error::operation_aborted)) {
                PrintFail(ec, "http_read");
            }
            DoEof();
            return;
        }
        const boost::beast::http::request<boost::beast::http::string_body> request = m_requestParser->release();
        const control_api_response_t apiResponse = m_controlApiRef.HandleRequest(
            std::string(request.method_string()), std::string(request.target()), request.body());

        m_responsePtr = std::make_shared<string_response_t>(
            static_cast<boost::beast::http::status>(apiResponse.statusCode), request.version());
        m_responsePtr->set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
        m_responsePtr->set(boost::beast::http::field::content_type, "application/json");
        m_responsePtr->keep_alive(request.keep_alive());
        m_responsePtr->body() = apiResponse.jsonBody;
        m_responsePtr->prepare_payload();

        boost::beast::http::async_write(
            m_tcpSocket,
            *m_responsePtr,
            boost::bind(
                &ControlHttpSession::HandleSendResponseCompleted,
                shared_from_this(),
                m_responsePtr->need_eof(),
                boost::placeholders::_1,
                boost::placeholders::_2));
    }

    void HandleSendResponseCompleted(bool close, boost::beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        m_responsePtr.reset();
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                PrintFail(ec, "http_write");
            }
            DoEof();
        }
        else if (close) {
            // The response indicated the "Connection: close" semantic.
            DoEof();
        }
        else {
            AsyncReadRequestFromRemoteClient();
        }
    }

    void DoEof() {
        Close();
        m_sessionsRef.erase(shared_from_this());
    }

private:
    boost::asio::ip::tcp::socket m_tcpSocket;
    ControlApi & m_controlApiRef;
    session_set_t & m_sessionsRef;
    boost::beast::flat_buffer m_flatBuffer;
    boost::optional<boost::beast::http::request_parser<boost::beast::http::string_body> > m_requestParser;
    std::shared_ptr<string_response_t> m_responsePtr;
};

struct ControlHttpServer::Impl : private boost::noncopyable {
    Impl() :
        m_tcpAcceptor(m_ioService),
        m_controlApiPtr(NULL),
        m_boundPort(0) {}
    ~Impl() {
        Stop();
    }

    bool Init(const std::string & bindAddress, uint16_t port, ControlApi & controlApi) {
        if (m_ioServiceThreadPtr) {
            LOG_ERROR(subprocess) << "control http server already running";
            return false;
        }
        boost::system::error_code ec;
        const boost::asio::ip::address address = boost::asio::ip::make_address(bindAddress, ec);
        if (ec) {
            LOG_ERROR(subprocess) << "invalid control http bind address " << bindAddress << ": " << ec.message();
            return false;
        }
        m_controlApiPtr = &controlApi;
        const boost::asio::ip::tcp::endpoint endpoint(address, port);
        m_tcpAcceptor.open(endpoint.protocol(), ec);
        if (ec) {
            PrintFail(ec, "open");
            return false;
        }
        m_tcpAcceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) {
            PrintFail(ec, "set_option");
            CloseAcceptor();
            return false;
        }
        m_tcpAcceptor.bind(endpoint, ec);
        if (ec) {
            PrintFail(ec, "bind");
            CloseAcceptor();
            return false;
        }
        m_tcpAcceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            PrintFail(ec, "listen");
            CloseAcceptor();
            return false;
        }
        m_boundPort = m_tcpAcceptor.local_endpoint(ec).port();

        m_ioService.restart();
        DoAccept();
        m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
        ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceControl");
        LOG_INFO(subprocess) << "control interface at http://" << bindAddress << ":" << m_boundPort;
        return true;
    }

    void Stop() {
        if (m_ioServiceThreadPtr) {
            // run() returns once the acceptor and every session have completed their aborted handlers
            boost::asio::post(m_ioService, boost::bind(&Impl::CloseAll, this));
            try {
                m_ioServiceThreadPtr->join();
            }
            catch (const boost::thread_resource_error &) {
                LOG_ERROR(subprocess) << "error stopping control http io_service";
            }
            m_ioServiceThreadPtr.reset();
            CloseAcceptor();
            m_sessions.clear();
            m_boundPort = 0;
        }
    }

    void CloseAcceptor() {
        if (m_tcpAcceptor.is_open()) {
            try {
                m_tcpAcceptor.close();
            }
            catch (const boost::system::system_error & e) {
                LOG_ERROR(subprocess) << "Error closing control HTTP TCP Acceptor:  " << e.what();
            }
        }
    }

    void CloseAll() {
        CloseAcceptor();
        //copy, since closing may erase from the set once the aborted handlers run
        const session_set_t sessions(m_sessions);
        for (session_set_t::const_iterator it = sessions.cbegin(); it != sessions.cend(); ++it) {
            (*it)->Close();
        }
    }

    void DoAccept() {
        std::shared_ptr<boost::asio::ip::tcp::socket> newTcpSocketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioService);
        boost::asio::ip::tcp::socket & socketRef = *newTcpSocketPtr;
        m_tcpAcceptor.async_accept(
            socketRef,
            boost::bind(
                &Impl::OnAccept,
                this,
                std::move(newTcpSocketPtr),
                boost::placeholders::_1));
    }

    void OnAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr, boost::beast::error_code ec) {
        if (!ec) {
            std::shared_ptr<ControlHttpSession> session = std::make_shared<ControlHttpSession>(
                std::move(*newTcpSocketPtr), *m_controlApiPtr, m_sessions);
            session->run();
            DoAccept();
        }
        else if (ec != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "tcp accept error: " << ec.message();
        }
    }

    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::acceptor m_tcpAcceptor;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    ControlApi * m_controlApiPtr;
    session_set_t m_sessions;
    std::atomic<uint16_t> m_boundPort;
};

ControlHttpServer::ControlHttpServer() : m_pimpl(boost::make_unique<ControlHttpServer::Impl>()) {}

ControlHttpServer::~ControlHttpServer() {
    Stop();
}

bool ControlHttpServer::Init(const std::string & bindAddress, uint16_t port, ControlApi & controlApi) {
    return m_pimpl->Init(bindAddress, port, controlApi);
}

void ControlHttpServer::Stop() {
    m_pimpl->Stop();
}

uint16_t ControlHttpServer::GetBoundPort() const {
    return m_pimpl->m_boundPort;
}
