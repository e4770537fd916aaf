#ifndef MEDIASHUTTLE_SRC_SERVER_HTTP_SERVER_HPP_
#define MEDIASHUTTLE_SRC_SERVER_HTTP_SERVER_HPP_

#include "api/file_manager.hpp"
#include "cancellation_token.hpp"
#include "config/config_types.hpp"
#include "server/worker_pool.hpp"
#include "transfer/transfer_orchestrator.hpp"
#include "transfer/transfer_types.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace MediaShuttle::Server
{

namespace net  = boost::asio;
namespace http = boost::beast::http;
using tcp      = net::ip::tcp;

// HTTP front end. Accepts on the io_context thread and serves every connection
// synchronously on a worker pool thread. Transfers are streamed back as
// server-sent events; a failed event write cancels that transfer.
class HttpServer
{
    public:
    using Request = http::request<http::string_body>;

    HttpServer(
        const Config::ServiceConfig &config, Transfer::TransferOrchestrator &orchestrator,
        Api::FileManager &file_manager
    );
    ~HttpServer();

    HttpServer(const HttpServer &)            = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    // Binds and listens on the configured address. Throws
    // boost::system::system_error when the endpoint is unusable.
    void Listen();

    // Serves until Stop() is called or SIGINT/SIGTERM arrives. Blocks.
    void Run();

    // Closes the listener, cancels running transfers and unblocks idle
    // connections. Safe to call from any thread.
    void Stop();

    std::uint16_t GetPort() const;

    private:
    void DoAccept();
    void HandleConnection(tcp::socket &socket);

    // Returns true when the connection may serve another request.
    bool HandleRequest(tcp::socket &socket, const Request &req);

    void StreamTransfer(
        tcp::socket &socket, const Request &req, const Transfer::TransferRequest &transfer
    );
    bool WriteJson(
        tcp::socket &socket, const Request &req, http::status status, const nlohmann::json &body
    );

    void Register(tcp::socket *socket);
    void Unregister(tcp::socket *socket);
    void Register(CancellationToken *token);
    void Unregister(CancellationToken *token);

    const Config::ServiceConfig config_;
    Transfer::TransferOrchestrator &orchestrator_;
    Api::FileManager &file_manager_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    net::signal_set signals_;
    WorkerPool pool_;

    std::mutex active_mutex_;
    std::unordered_set<tcp::socket *> active_sockets_;
    std::unordered_set<CancellationToken *> active_transfers_;
    std::atomic<bool> stopping_{false};
};

}  // namespace MediaShuttle::Server

#endif  // MEDIASHUTTLE_SRC_SERVER_HTTP_SERVER_HPP_
