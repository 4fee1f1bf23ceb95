// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/ProcessProbe.hpp>
#include <mcp/Transport.hpp>
#include <mcp/TransportFactory.hpp>

#include <atomic>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcphub::test
{

/// @brief Scriptable transport: answers requests through a handler and records what was sent.
class FakeTransport: public Transport
{
  public:
    using Handler = std::function<Result<jsonrpc::Response>(const nlohmann::json& request)>;

    explicit FakeTransport(TransportKind kind = TransportKind::Stdio, ConnectionInfo info = {}):
        _kind(kind), _info(std::move(info))
    {
    }

    auto start() -> Result<ConnectionInfo> override
    {
        ++startCount;
        if (onStart)
            onStart();
        if (startError)
            return std::unexpected(*startError);
        started = true;
        healthy = true;
        return _info;
    }

    auto send(const nlohmann::json& request) -> Result<jsonrpc::Response> override
    {
        {
            auto lock = std::lock_guard { _mutex };
            sent.push_back(request);
        }
        if (!handler)
            return makeError(ErrorCode::TransportError, "No handler installed");
        return handler(request);
    }

    auto notify(const nlohmann::json& notification) -> VoidResult override
    {
        auto lock = std::lock_guard { _mutex };
        sent.push_back(notification);
        return {};
    }

    auto notifications() -> NotificationHub& override { return _hub; }

    void stop() override
    {
        ++stopCount;
        started = false;
        healthy = false;
    }

    auto isHealthy() -> bool override { return healthy; }

    auto kind() const -> TransportKind override { return _kind; }

    /// @brief Answers every request with the given result.
    void respondWith(nlohmann::json result)
    {
        handler = [result = std::move(result)](const nlohmann::json& request) -> Result<jsonrpc::Response> {
            return jsonrpc::Response { .id = request["id"], .result = result };
        };
    }

    /// @brief Answers every request with a JSON-RPC error payload.
    void failWith(int code, std::string message)
    {
        handler = [code, message = std::move(message)](const nlohmann::json& request) -> Result<jsonrpc::Response> {
            return jsonrpc::Response {
                .id = request["id"],
                .error = jsonrpc::RpcError { .code = code, .message = message },
            };
        };
    }

    auto sentMethods() -> std::vector<std::string>
    {
        auto lock = std::lock_guard { _mutex };
        auto methods = std::vector<std::string> {};
        for (auto const& message: sent)
            methods.push_back(message.value("method", ""));
        return methods;
    }

    Handler handler;
    std::function<void()> onStart;
    std::optional<Error> startError;
    std::vector<nlohmann::json> sent;
    std::atomic<int> startCount = 0;
    std::atomic<int> stopCount = 0;
    std::atomic<bool> started = false;
    std::atomic<bool> healthy = false;

  private:
    TransportKind _kind;
    ConnectionInfo _info;
    NotificationHub _hub;
    std::mutex _mutex;
};

/// @brief Process probe over an explicit set of live pids.
///
/// Every live pid carries the marker unless it is listed as foreign.
class FakeProcessProbe: public ProcessProbe
{
  public:
    auto isAlive(int pid) const -> bool override
    {
        auto lock = std::lock_guard { _mutex };
        return alive.contains(pid);
    }

    auto hasMarker(int pid) const -> bool override
    {
        auto lock = std::lock_guard { _mutex };
        return alive.contains(pid) && !foreign.contains(pid);
    }

    void kill(int pid)
    {
        auto lock = std::lock_guard { _mutex };
        alive.erase(pid);
    }

    void spawn(int pid)
    {
        auto lock = std::lock_guard { _mutex };
        alive.insert(pid);
    }

    std::set<int> alive;
    std::set<int> foreign;

  private:
    mutable std::mutex _mutex;
};

/// @brief Factory handing out FakeTransports; stdio ones get increasing pids starting at basePid.
class FakeTransportFactory: public TransportFactory
{
  public:
    explicit FakeTransportFactory(int basePid = 4242): _nextPid(basePid) {}

    auto create(const ServerDescriptor& descriptor) -> Result<std::shared_ptr<Transport>> override
    {
        auto lock = std::lock_guard { _mutex };
        ++createCount;
        if (createError)
            return std::unexpected(*createError);

        auto info = ConnectionInfo {};
        if (descriptor.transport == TransportKind::Stdio)
        {
            info.pid = _nextPid++;
            info.port = static_cast<uint16_t>(9000 + createCount);
            info.proxyUrl = std::format("http://127.0.0.1:{}/mcp", *info.port);
            if (probe)
                probe->spawn(*info.pid);
        }

        auto transport = std::make_shared<FakeTransport>(descriptor.transport, info);
        if (startError)
            transport->startError = startError;
        if (onCreate)
            onCreate(descriptor, *transport);
        created[descriptor.id].push_back(transport);
        return transport;
    }

    /// @brief Most recent transport created for a server, or nullptr.
    auto last(const std::string& serverId) -> std::shared_ptr<FakeTransport>
    {
        auto lock = std::lock_guard { _mutex };
        auto it = created.find(serverId);
        if (it == created.end() || it->second.empty())
            return nullptr;
        return it->second.back();
    }

    /// Spawned pids are marked alive here.
    std::shared_ptr<FakeProcessProbe> probe;
    std::function<void(const ServerDescriptor&, FakeTransport&)> onCreate;
    std::optional<Error> createError;
    std::optional<Error> startError;
    std::map<std::string, std::vector<std::shared_ptr<FakeTransport>>> created;
    int createCount = 0;

  private:
    int _nextPid;
    std::mutex _mutex;
};

} // namespace mcphub::test
