#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ixport::test_utils {

/** A request as the server received it */
struct RecordedRequest
{
    std::string method;
    std::string target;
    std::string api_key;
    std::string body;
};

/**
 * Loopback HTTP server that answers each connection with the next scripted
 * reply
 *
 * Serves one connection at a time on 127.0.0.1 and an ephemeral port. A
 * request that arrives with nothing left in the script gets a 500.
 */
class ScriptedHttpServer
{
public:
    ScriptedHttpServer();
    ~ScriptedHttpServer();

    ScriptedHttpServer(const ScriptedHttpServer&) = delete;
    ScriptedHttpServer&
    operator=(const ScriptedHttpServer&) = delete;

    /** Reply with this status and JSON body */
    void
    push_response(unsigned status, std::string body);

    /** Close the connection after reading the request, without replying */
    void
    push_disconnect();

    /** Read the request and then hold the connection open without replying */
    void
    push_silence();

    /** http://127.0.0.1:<port> */
    std::string
    endpoint() const;

    std::vector<RecordedRequest>
    requests() const;

    std::size_t
    request_count() const;

private:
    enum class Action { Respond, Disconnect, Silence };

    struct Reply
    {
        Action action = Action::Respond;
        unsigned status = 200;
        std::string body;
    };

    void
    serve();

    void
    handle(boost::asio::ip::tcp::socket socket);

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::deque<Reply> script_;
    std::vector<RecordedRequest> requests_;

    // Connections kept open by push_silence(); closed on destruction
    std::vector<boost::asio::ip::tcp::socket> held_;

    std::thread thread_;
};

}  // namespace ixport::test_utils
