#include "server/http_server.hpp"

#include "api/event_serializer.hpp"
#include "api/request_parser.hpp"
#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <csignal>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace MediaShuttle::Server
{

namespace beast = boost::beast;

namespace
{

constexpr std::string_view kTransferRoute       = "/api/files/batch-transfer";
constexpr std::string_view kTransferLegacyRoute = "/api/files/batch-rename-stream";
constexpr std::string_view kCheckExistsRoute    = "/api/files/check-exists";
constexpr std::string_view kCheckDestRoute      = "/api/files/check-destinations";
constexpr std::string_view kFolderRoute         = "/api/files/folder";
constexpr std::string_view kFilesRoute          = "/api/files";

std::string_view TargetPath(std::string_view target)
{
    const auto query = target.find('?');
    return query == std::string_view::npos ? target : target.substr(0, query);
}

int HexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// application/x-www-form-urlencoded decoding; malformed escapes are kept verbatim.
std::string DecodeComponent(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 &&
                   HexValue(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Query string of `target` as a flat JSON object of strings. Later keys win.
nlohmann::json ParseQuery(std::string_view target)
{
    auto params     = nlohmann::json::object();
    const auto mark = target.find('?');
    if (mark == std::string_view::npos) {
        return params;
    }
    std::string_view rest = target.substr(mark + 1);
    while (!rest.empty()) {
        const auto amp        = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        const auto key = DecodeComponent(pair.substr(0, eq));
        params[key]    = eq == std::string_view::npos ? std::string{} : DecodeComponent(pair.substr(eq + 1));
    }
    return params;
}

nlohmann::json ParseBody(const std::string &body)
{
    return nlohmann::json::parse(body, nullptr, false);
}

}  // namespace

HttpServer::HttpServer(
    const Config::ServiceConfig &config, Transfer::TransferOrchestrator &orchestrator,
    Api::FileManager &file_manager
)
    : config_(config),
      orchestrator_(orchestrator),
      file_manager_(file_manager),
      acceptor_(ioc_),
      signals_(ioc_, SIGINT, SIGTERM),
      pool_(config.global_settings.worker_threads)
{
}

HttpServer::~HttpServer()
{
    Stop();
    pool_.Shutdown();
}

//------------------------------------------------------------------------------//
// Lifecycle
//------------------------------------------------------------------------------//

void HttpServer::Listen()
{
    const tcp::endpoint endpoint{
        net::ip::make_address(config_.global_settings.listen_address),
        config_.global_settings.listen_port
    };
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    spdlog::info(
        "Listening on {}:{}", acceptor_.local_endpoint().address().to_string(), GetPort()
    );
}

std::uint16_t HttpServer::GetPort() const { return acceptor_.local_endpoint().port(); }

void HttpServer::Run()
{
    if (!acceptor_.is_open()) {
        throw std::runtime_error("HttpServer::Run called before Listen");
    }
    signals_.async_wait([this](const boost::system::error_code &ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        Stop();
    });
    DoAccept();
    ioc_.run();
    pool_.Shutdown();
    spdlog::info("Server stopped");
}

void HttpServer::Stop()
{
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        for (auto *token : active_transfers_) {
            token->Cancel();
        }
        // Unblocks connections sitting in a blocking read.
        for (auto *socket : active_sockets_) {
            ::shutdown(socket->native_handle(), SHUT_RDWR);
        }
    }
    net::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    });
}

void HttpServer::DoAccept()
{
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            auto connection = std::make_shared<tcp::socket>(std::move(socket));
            try {
                pool_.SubmitTask([this, connection] {
                    HandleConnection(*connection);
                });
            } catch (const std::runtime_error &e) {
                spdlog::warn("Dropping connection: {}", e.what());
            }
        }
        if (acceptor_.is_open()) {
            DoAccept();
        }
    });
}

void HttpServer::Register(tcp::socket *socket)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_sockets_.insert(socket);
}

void HttpServer::Unregister(tcp::socket *socket)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_sockets_.erase(socket);
}

void HttpServer::Register(CancellationToken *token)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (stopping_) {
        token->Cancel();
    }
    active_transfers_.insert(token);
}

void HttpServer::Unregister(CancellationToken *token)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_transfers_.erase(token);
}

//------------------------------------------------------------------------------//
// Connection Handling
//------------------------------------------------------------------------------//

void HttpServer::HandleConnection(tcp::socket &socket)
{
    Register(&socket);
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    while (!stopping_) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(Constants::MAX_REQUEST_BODY_BYTES);
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            Request rejected{http::verb::post, "/", 11};
            rejected.keep_alive(false);
            WriteJson(
                socket, rejected, http::status::payload_too_large,
                nlohmann::json{{"success", false}, {"error", "Request body too large"}}
            );
            break;
        }
        if (ec) {
            spdlog::debug("Read failed: {}", ec.message());
            break;
        }
        const Request req = parser.release();
        if (!HandleRequest(socket, req)) {
            break;
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
    Unregister(&socket);
}

bool HttpServer::HandleRequest(tcp::socket &socket, const Request &req)
{
    const auto path =
        TargetPath(std::string_view(req.target().data(), req.target().size()));
    spdlog::debug(
        "{} {}", std::string_view(req.method_string().data(), req.method_string().size()), path
    );

    auto method_not_allowed = [&] {
        return WriteJson(
            socket, req, http::status::method_not_allowed,
            nlohmann::json{{"success", false}, {"error", "Method not allowed"}}
        );
    };

    if (path == kTransferRoute || path == kTransferLegacyRoute) {
        if (req.method() != http::verb::post) {
            return method_not_allowed();
        }
        const auto body = ParseBody(req.body());
        if (body.is_discarded()) {
            return WriteJson(
                socket, req, http::status::bad_request,
                nlohmann::json{{"type", "error"}, {"message", "request body must be valid JSON"}}
            );
        }
        auto transfer = Api::ParseTransferRequest(body);
        if (!transfer) {
            return WriteJson(
                socket, req, http::status::bad_request,
                nlohmann::json{{"type", "error"}, {"message", transfer.error()}}
            );
        }
        StreamTransfer(socket, req, *transfer);
        return false;
    }

    Api::ApiResponse (Api::FileManager::*handler)(const nlohmann::json &) = nullptr;
    http::verb expected_method = http::verb::post;
    if (path == kCheckExistsRoute) {
        handler = &Api::FileManager::CheckExists;
    } else if (path == kCheckDestRoute) {
        handler = &Api::FileManager::CheckDestinations;
    } else if (path == kFolderRoute) {
        handler = &Api::FileManager::CreateFolder;
    } else if (path == kFilesRoute) {
        if (req.method() == http::verb::get) {
            const auto query =
                ParseQuery(std::string_view(req.target().data(), req.target().size()));
            const auto response = file_manager_.List(query);
            return WriteJson(socket, req, static_cast<http::status>(response.status), response.body);
        }
        handler         = &Api::FileManager::Delete;
        expected_method = http::verb::delete_;
    } else {
        return WriteJson(
            socket, req, http::status::not_found,
            nlohmann::json{{"success", false}, {"error", "Not found"}}
        );
    }
    if (req.method() != expected_method) {
        return method_not_allowed();
    }

    const auto body = ParseBody(req.body());
    if (body.is_discarded()) {
        return WriteJson(
            socket, req, http::status::bad_request,
            nlohmann::json{{"success", false}, {"error", "Request body must be valid JSON"}}
        );
    }
    const auto response = (file_manager_.*handler)(body);
    return WriteJson(socket, req, static_cast<http::status>(response.status), response.body);
}

bool HttpServer::WriteJson(
    tcp::socket &socket, const Request &req, http::status status, const nlohmann::json &body
)
{
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, std::string(Constants::APP_NAME));
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();

    boost::system::error_code ec;
    http::write(socket, res, ec);
    if (ec) {
        spdlog::debug("Response write failed: {}", ec.message());
        return false;
    }
    return res.keep_alive();
}

//------------------------------------------------------------------------------//
// Event Stream
//------------------------------------------------------------------------------//

void HttpServer::StreamTransfer(
    tcp::socket &socket, const Request &req, const Transfer::TransferRequest &transfer
)
{
    http::response<http::empty_body> res{http::status::ok, req.version()};
    res.set(http::field::server, std::string(Constants::APP_NAME));
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-cache");
    res.keep_alive(false);
    res.chunked(true);

    boost::system::error_code ec;
    http::response_serializer<http::empty_body> serializer{res};
    http::write_header(socket, serializer, ec);
    if (ec) {
        spdlog::debug("Event stream header write failed: {}", ec.message());
        return;
    }

    CancellationToken token;
    Register(&token);
    bool disconnected = false;

    const Transfer::EventSink sink = [&](const Transfer::TransferEvent &event) {
        if (disconnected) {
            return;
        }
        const auto frame = Api::FormatSseFrame(event);
        boost::system::error_code write_ec;
        net::write(socket, http::make_chunk(net::buffer(frame)), write_ec);
        if (write_ec) {
            disconnected = true;
            spdlog::info("Client went away ({}), cancelling transfer", write_ec.message());
            token.Cancel();
        }
    };

    const auto summary = orchestrator_.Run(transfer, sink, token);
    Unregister(&token);

    if (!disconnected) {
        net::write(socket, http::make_chunk_last(), ec);
    }
    spdlog::debug(
        "Event stream closed: {} completed, {} failed{}", summary.completed, summary.failed,
        summary.aborted ? " (aborted)" : ""
    );
}

}  // namespace MediaShuttle::Server
