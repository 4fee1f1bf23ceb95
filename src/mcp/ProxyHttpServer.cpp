// SPDX-License-Identifier: Apache-2.0
#include "ProxyHttpServer.hpp"

#include <core/Log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include <sys/socket.h>

namespace mcphub
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

struct ProxyHttpServer::State
{
    explicit State(ProxyEndpoints e): endpoints(std::move(e)) {}

    ProxyEndpoints endpoints;
    asio::io_context io;
    tcp::acceptor acceptor { io };
    std::thread ioThread;
    uint16_t port = 0;
    std::atomic<bool> listening = false;
    std::atomic<bool> stopping = false;

    std::mutex mutex;
    std::condition_variable drained;
    std::set<std::shared_ptr<tcp::socket>> connections;
};

namespace
{
    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    constexpr auto KeepAliveInterval = std::chrono::seconds(15);
    constexpr auto EventPollInterval = std::chrono::milliseconds(50);

    // Tool output may carry invalid UTF-8; it is replaced rather than failing the exchange.
    auto dumpJson(const nlohmann::json& value) -> std::string
    {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto jsonResponse(const HttpRequest& request, http::status status, const nlohmann::json& body) -> HttpResponse
    {
        auto response = HttpResponse { status, request.version() };
        response.set(http::field::server, "mcphub-proxy");
        response.set(http::field::content_type, "application/json");
        response.keep_alive(false);
        response.body() = dumpJson(body);
        response.prepare_payload();
        return response;
    }

    auto rpcError(nlohmann::json id, int code, std::string message) -> nlohmann::json
    {
        auto error = jsonrpc::RpcError { .code = code, .message = std::move(message) };
        return jsonrpc::makeErrorResponse(std::move(id), error);
    }

    auto pathOf(const HttpRequest& request) -> std::string
    {
        auto path = std::string(request.target());
        if (auto const query = path.find('?'); query != std::string::npos)
            path.resize(query);
        while (path.size() > 1 && path.back() == '/')
            path.pop_back();
        return path;
    }

    auto forwardMessage(const ProxyEndpoints& endpoints, const HttpRequest& request) -> HttpResponse
    {
        auto const message = nlohmann::json::parse(request.body(), nullptr, false);
        if (message.is_discarded() || !message.is_object())
            return jsonResponse(request, http::status::bad_request, rpcError(nullptr, -32700, "Parse error"));

        switch (jsonrpc::classify(message))
        {
            case jsonrpc::MessageKind::Notification:
                if (auto sent = endpoints.notify(message); !sent)
                    return jsonResponse(
                        request, http::status::internal_server_error, { { "error", sent.error().message } });
                return jsonResponse(request, http::status::accepted, nlohmann::json::object());

            case jsonrpc::MessageKind::Request: {
                auto response = endpoints.request(message);
                if (!response)
                    return jsonResponse(request,
                                        http::status::internal_server_error,
                                        rpcError(message["id"], -32603, response.error().message));
                if (response->error)
                    return jsonResponse(
                        request, http::status::ok, jsonrpc::makeErrorResponse(response->id, *response->error));
                return jsonResponse(request,
                                    http::status::ok,
                                    jsonrpc::makeResponse(response->id, response->result.value_or(nullptr)));
            }

            case jsonrpc::MessageKind::Response:
            case jsonrpc::MessageKind::Invalid: break;
        }
        return jsonResponse(request, http::status::bad_request, rpcError(nullptr, -32600, "Invalid Request"));
    }

    auto route(const ProxyEndpoints& endpoints, const HttpRequest& request, const std::string& path) -> HttpResponse
    {
        if (path == "/health")
        {
            if (request.method() != http::verb::get)
                return jsonResponse(request, http::status::method_not_allowed, { { "error", "GET only" } });
            if (endpoints.healthy && endpoints.healthy())
                return jsonResponse(request, http::status::ok, { { "status", "healthy" } });
            return jsonResponse(request, http::status::service_unavailable, { { "status", "unhealthy" } });
        }

        if (path == "/mcp" || path.starts_with("/messages/"))
        {
            if (request.method() != http::verb::post)
                return jsonResponse(request, http::status::method_not_allowed, { { "error", "POST only" } });
            return forwardMessage(endpoints, request);
        }

        return jsonResponse(request, http::status::not_found, { { "error", std::format("No route for {}", path) } });
    }

    /// Writes server notifications as SSE events until the client goes away or the server stops.
    void streamNotifications(ProxyHttpServer::State& state, tcp::socket& socket)
    {
        auto ec = beast::error_code {};
        auto const header = std::string { "HTTP/1.1 200 OK\r\n"
                                          "Content-Type: text/event-stream\r\n"
                                          "Cache-Control: no-cache\r\n"
                                          "Connection: keep-alive\r\n\r\n" };
        asio::write(socket, asio::buffer(header), ec);
        if (ec)
            return;

        auto mutex = std::mutex {};
        auto queue = std::deque<std::string> {};
        auto subscription = state.endpoints.notifications->subscribe([&](const nlohmann::json& notification) {
            auto lock = std::lock_guard { mutex };
            queue.push_back(std::format("event: message\ndata: {}\n\n", dumpJson(notification)));
        });

        auto lastWrite = std::chrono::steady_clock::now();
        while (!state.stopping)
        {
            auto chunk = std::string {};
            {
                auto lock = std::lock_guard { mutex };
                if (!queue.empty())
                {
                    chunk = std::move(queue.front());
                    queue.pop_front();
                }
            }

            auto const now = std::chrono::steady_clock::now();
            if (chunk.empty() && now - lastWrite > KeepAliveInterval)
                chunk = ": ping\n\n";
            if (chunk.empty())
            {
                std::this_thread::sleep_for(EventPollInterval);
                continue;
            }

            asio::write(socket, asio::buffer(chunk), ec);
            if (ec)
                break;
            lastWrite = now;
        }
    }

    void serveConnection(const std::shared_ptr<ProxyHttpServer::State>& state,
                         const std::shared_ptr<tcp::socket>& socket)
    {
        auto buffer = beast::flat_buffer {};
        auto request = HttpRequest {};
        auto ec = beast::error_code {};
        http::read(*socket, buffer, request, ec);

        if (ec)
            log::trace("Proxy on port {} dropped a connection: {}", state->port, ec.message());
        else if (auto const path = pathOf(request);
                 path == "/sse" && request.method() == http::verb::get && state->endpoints.notifications)
            streamNotifications(*state, *socket);
        else
        {
            auto response = route(state->endpoints, request, path);
            http::write(*socket, response, ec);
        }

        socket->shutdown(tcp::socket::shutdown_both, ec);

        auto lock = std::lock_guard { state->mutex };
        state->connections.erase(socket);
        state->drained.notify_all();
    }

    void dispatch(const std::shared_ptr<ProxyHttpServer::State>& state, tcp::socket socket)
    {
        auto connection = std::make_shared<tcp::socket>(std::move(socket));
        {
            auto lock = std::lock_guard { state->mutex };
            if (state->stopping)
                return;
            state->connections.insert(connection);
        }

        try
        {
            std::thread([state, connection] { serveConnection(state, connection); }).detach();
        }
        catch (const std::system_error& e)
        {
            log::error("Proxy on port {} cannot serve a connection: {}", state->port, e.what());
            auto lock = std::lock_guard { state->mutex };
            state->connections.erase(connection);
            state->drained.notify_all();
        }
    }

    void acceptNext(const std::shared_ptr<ProxyHttpServer::State>& state)
    {
        state->acceptor.async_accept(
            [weak = std::weak_ptr<ProxyHttpServer::State>(state)](beast::error_code ec, tcp::socket socket) {
                auto state = weak.lock();
                if (!state || state->stopping || ec == asio::error::operation_aborted)
                    return;
                if (ec)
                    log::debug("Proxy on port {} failed to accept: {}", state->port, ec.message());
                else
                    dispatch(state, std::move(socket));
                acceptNext(state);
            });
    }

} // namespace

ProxyHttpServer::ProxyHttpServer(ProxyEndpoints endpoints): _state(std::make_shared<State>(std::move(endpoints)))
{
}

ProxyHttpServer::~ProxyHttpServer()
{
    stop();
}

auto ProxyHttpServer::listen(uint16_t port) -> VoidResult
{
    auto& acceptor = _state->acceptor;
    if (acceptor.is_open())
        return makeError(ErrorCode::InvalidArgument, std::format("Proxy already listens on port {}", _state->port));

    auto ec = beast::error_code {};
    auto const endpoint = tcp::endpoint { asio::ip::address_v4::loopback(), port };
    acceptor.open(endpoint.protocol(), ec);
    if (!ec)
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
        acceptor.bind(endpoint, ec);
    if (!ec)
        acceptor.listen(asio::socket_base::max_listen_connections, ec);

    if (ec)
    {
        auto ignored = beast::error_code {};
        acceptor.close(ignored);
        return makeError(ErrorCode::TransportError,
                         std::format("Cannot listen on 127.0.0.1:{}: {}", port, ec.message()));
    }

    _state->port = port;
    _state->listening = true;
    return {};
}

void ProxyHttpServer::start()
{
    auto& state = *_state;
    if (!state.listening || state.ioThread.joinable())
        return;

    acceptNext(_state);
    state.ioThread = std::thread([&state] { state.io.run(); });
    log::debug("Proxy endpoint listening on 127.0.0.1:{}", state.port);
}

void ProxyHttpServer::stop()
{
    auto& state = *_state;
    if (state.stopping.exchange(true))
        return;
    state.listening = false;

    auto closeAcceptor = [&state] {
        auto ec = beast::error_code {};
        state.acceptor.close(ec);
    };
    if (state.ioThread.joinable())
    {
        asio::post(state.io, closeAcceptor);
        state.ioThread.join();
    }
    else
        closeAcceptor();

    auto lock = std::unique_lock { state.mutex };
    for (auto const& connection: state.connections)
        ::shutdown(connection->native_handle(), SHUT_RDWR);
    state.drained.wait(lock, [&state] { return state.connections.empty(); });
}

auto ProxyHttpServer::isListening() const -> bool
{
    return _state->listening;
}

} // namespace mcphub
