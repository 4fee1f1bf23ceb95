// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/ProcessProbe.hpp>
#include <mcp/ProxyManager.hpp>
#include <mcp/TransportFactory.hpp>
#include <mcphub/Config.hpp>
#include <server/AutoRestart.hpp>
#include <server/ServerManager.hpp>
#include <server/ServerRegistry.hpp>
#include <store/InMemoryStore.hpp>
#include <tools/ToolCatalog.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>
#include <print>

#include <pthread.h>

namespace
{

void printTools(mcphub::ServerManager& manager, mcphub::ToolCatalog& catalog)
{
    for (auto const& serverId: manager.registry().runningIds())
    {
        auto tools = catalog.listForServer(serverId);
        if (!tools)
        {
            mcphub::log::error("Cannot list tools of {}: {}", serverId, tools.error());
            continue;
        }

        std::println("{} ({} tools)", serverId, tools->size());
        for (auto const& tool: *tools)
            std::println("  {:<32} {}", tool.name, tool.description);
    }
}

/// Blocks until SIGINT or SIGTERM arrives. The signals must already be blocked in every thread.
auto waitForTermination(const sigset_t& signals) -> int
{
    auto signal = 0;
    sigwait(&signals, &signal);
    return signal;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcphub - MCP tool server orchestration hub" };

    auto configPath = std::string {};
    auto dataDir = std::string {};
    auto verbose = false;
    auto listTools = false;
    auto once = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--data-dir", dataDir, "Directory for server logs");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--list-tools", listTools, "Print the tools of every running server");
    app.add_flag("--once", once, "Exit after startup instead of serving until interrupted");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? mcphub::loadConfig() : mcphub::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcphub::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    mcphub::log::setLevel(verbose ? mcphub::log::Level::Debug : config.hub.logLevel);
    if (!dataDir.empty())
        config.hub.dataDir = dataDir;
    if (config.hub.dataDir.empty())
        config.hub.dataDir = mcphub::defaultDataDir();

    // Every thread spawned from here on inherits the mask, so only sigwait() sees these.
    auto signals = sigset_t {};
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto store = std::make_shared<mcphub::InMemoryStore>();
    for (auto const& [name, descriptor]: config.mcpServers)
    {
        if (auto seeded = store->upsertServer(descriptor); !seeded)
        {
            mcphub::log::error("Cannot register server {}: {}", name, seeded.error());
            return 1;
        }
    }

    auto proxies = std::make_shared<mcphub::ProxyManager>(config.hub.dataDir, config.proxy);
    auto factory =
        std::make_shared<mcphub::DefaultTransportFactory>(proxies, mcphub::makeHttpClient(), config.transport);
    auto manager = std::make_shared<mcphub::ServerManager>(store,
                                                           std::make_shared<mcphub::ServerRegistry>(),
                                                           factory,
                                                           proxies,
                                                           std::make_shared<mcphub::SystemProcessProbe>(),
                                                           config.hub.dataDir);

    auto catalog = std::make_shared<mcphub::ToolCatalog>(
        store, store, [manager](const std::string& serverId) { return manager->transportFor(serverId); });
    manager->setDiscoveryHook([catalog](const std::string& serverId) -> mcphub::VoidResult {
        return catalog->discover(serverId).transform([](size_t) {});
    });

    if (auto reconciled = manager->reconcile(); !reconciled)
    {
        mcphub::log::error("Startup reconciliation failed: {}", reconciled.error());
        manager->shutdownAll();
        return 1;
    }

    mcphub::log::info("{} of {} configured servers running",
                      manager->registry().size(),
                      config.mcpServers.size());
    if (auto servers = store->listServers(); servers)
    {
        for (auto const& server: *servers)
            mcphub::log::debug(
                "  {:<24} {}", server.descriptor.id, mcphub::serverStatusToString(server.runtime.status));
    }

    if (listTools)
        printTools(*manager, *catalog);

    if (!once)
    {
        auto supervisor = mcphub::AutoRestart(manager, store, config.autoRestart);
        supervisor.start();

        auto const signal = waitForTermination(signals);
        mcphub::log::info("Received signal {}, shutting down", signal);
        supervisor.stop();
    }

    manager->shutdownAll();
    return 0;
}
