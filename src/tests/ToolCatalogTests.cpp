// SPDX-License-Identifier: Apache-2.0
#include <store/InMemoryStore.hpp>
#include <tools/ToolCatalog.hpp>

#include "FakeTransport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

auto toolList(std::initializer_list<std::string> names) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    for (auto const& name: names)
        tools.push_back({ { "name", name }, { "description", name + " tool" } });
    return { { "tools", tools } };
}

struct CatalogFixture
{
    clock::TimePoint now = clock::now();
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::map<std::string, std::shared_ptr<test::FakeTransport>> running;
    ToolCatalog catalog { store,
                          store,
                          [this](const std::string& serverId) -> Result<std::shared_ptr<Transport>> {
                              auto it = running.find(serverId);
                              if (it == running.end())
                                  return makeError(ErrorCode::NotFound, "not running");
                              return it->second;
                          },
                          [this] { return now; } };

    auto addServer(std::string id, std::optional<std::string> owner, bool enabled = true)
        -> std::shared_ptr<test::FakeTransport>
    {
        auto const isSystem = !owner.has_value();
        auto descriptor = ServerDescriptor {
            .id = id,
            .ownerId = std::move(owner),
            .name = id,
            .displayName = id,
            .isSystem = isSystem,
            .enabled = enabled,
            .command = "echo",
        };
        REQUIRE(store->upsertServer(descriptor).has_value());
        auto transport = std::make_shared<test::FakeTransport>();
        running[id] = transport;
        return transport;
    }
};

} // namespace

TEST_CASE("ToolCatalog discovery replaces the whole tool set", "[catalog]")
{
    auto fx = CatalogFixture {};
    auto transport = fx.addServer("s1", "u1");

    transport->respondWith(toolList({ "a", "b", "c" }));
    auto first = fx.catalog.discover("s1");
    REQUIRE(first.has_value());
    CHECK(*first == 3);
    CHECK(transport->sentMethods() == std::vector<std::string> { "tools/list" });

    transport->respondWith(toolList({ "b", "d" }));
    auto second = fx.catalog.discover("s1");
    REQUIRE(second.has_value());
    CHECK(*second == 2);

    auto tools = fx.catalog.listForServer("s1");
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "b");
    CHECK((*tools)[1].name == "d");

    auto record = fx.store->getServer("s1");
    CHECK((*record)->runtime.toolCount == 2);
    CHECK((*record)->runtime.toolsDiscoveredAt == fx.now);
}

TEST_CASE("ToolCatalog keeps the cache when discovery fails", "[catalog]")
{
    auto fx = CatalogFixture {};
    auto transport = fx.addServer("s1", "u1");
    transport->respondWith(toolList({ "a" }));
    REQUIRE(fx.catalog.discover("s1").has_value());

    SECTION("server error")
    {
        transport->failWith(-32601, "Method not found");
        auto failed = fx.catalog.discover("s1");
        REQUIRE(!failed.has_value());
        CHECK(failed.error().code == ErrorCode::ProtocolError);
    }

    SECTION("malformed tool list")
    {
        auto nameless = nlohmann::json::array({ nlohmann::json { { "description", "nameless" } } });
        transport->respondWith(nlohmann::json { { "tools", nameless } });
        auto failed = fx.catalog.discover("s1");
        REQUIRE(!failed.has_value());
        CHECK(failed.error().code == ErrorCode::ProtocolError);
    }

    SECTION("server not running")
    {
        fx.running.erase("s1");
        auto failed = fx.catalog.discover("s1");
        REQUIRE(!failed.has_value());
        CHECK(failed.error().code == ErrorCode::NotFound);
    }

    CHECK(fx.catalog.listForServer("s1")->size() == 1);
}

TEST_CASE("ToolCatalog discovery of an unknown server fails", "[catalog]")
{
    auto fx = CatalogFixture {};
    auto failed = fx.catalog.discover("ghost");
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::NotFound);
}

TEST_CASE("ToolCatalog parseToolList fills in defaults", "[catalog]")
{
    auto const single = nlohmann::json::array({ nlohmann::json { { "name", "x" } } });
    auto parsed = ToolCatalog::parseToolList(nlohmann::json { { "tools", single } });
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 1);
    CHECK(parsed->front().description.empty());
    CHECK(parsed->front().inputSchema == nlohmann::json { { "type", "object" } });

    CHECK(!ToolCatalog::parseToolList(nlohmann::json::object()).has_value());
    CHECK(!ToolCatalog::parseToolList(nlohmann::json { { "tools", "nope" } }).has_value());
}

TEST_CASE("ToolCatalog findByName prefers the user's own server", "[catalog]")
{
    auto fx = CatalogFixture {};
    fx.addServer("system", std::nullopt)->respondWith(toolList({ "search" }));
    fx.addServer("mine", "u1")->respondWith(toolList({ "search" }));
    fx.addServer("theirs", "u2")->respondWith(toolList({ "search", "private" }));
    for (auto const* id: { "system", "mine", "theirs" })
        REQUIRE(fx.catalog.discover(id).has_value());

    auto found = fx.catalog.findByName("u1", "search");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->tool.serverId == "mine");
    CHECK(!(*found)->isSystem);

    auto forOther = fx.catalog.findByName("u3", "search");
    REQUIRE(forOther->has_value());
    CHECK((*forOther)->tool.serverId == "system");

    auto pinned = fx.catalog.findByName("u1", "search", std::string("system"));
    REQUIRE(pinned->has_value());
    CHECK((*pinned)->tool.serverId == "system");

    CHECK(!fx.catalog.findByName("u1", "private")->has_value());
    CHECK(!fx.catalog.findByName("u1", "missing")->has_value());
}

TEST_CASE("ToolCatalog skips disabled servers", "[catalog]")
{
    auto fx = CatalogFixture {};
    fx.addServer("off", std::nullopt, false)->respondWith(toolList({ "t" }));
    REQUIRE(fx.catalog.discover("off").has_value());

    CHECK(!fx.catalog.findByName("u1", "t")->has_value());
    CHECK(fx.catalog.listAccessible("u1")->empty());
}

TEST_CASE("ToolCatalog listAccessible is sorted by server then tool", "[catalog]")
{
    auto fx = CatalogFixture {};
    fx.addServer("zeta", std::nullopt)->respondWith(toolList({ "b", "a" }));
    fx.addServer("alpha", "u1")->respondWith(toolList({ "c" }));
    fx.addServer("hidden", "u2")->respondWith(toolList({ "d" }));
    for (auto const* id: { "zeta", "alpha", "hidden" })
        REQUIRE(fx.catalog.discover(id).has_value());

    auto tools = fx.catalog.listAccessible("u1");
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 3);
    CHECK((*tools)[0].tool.name == "c");
    CHECK((*tools)[1].tool.name == "a");
    CHECK((*tools)[2].tool.name == "b");
    CHECK((*tools)[2].serverDisplayName == "zeta");
}

TEST_CASE("ToolCatalog rediscovers only stale caches", "[catalog]")
{
    auto fx = CatalogFixture {};
    auto transport = fx.addServer("s1", "u1");
    transport->respondWith(toolList({ "a" }));

    CHECK(*fx.catalog.shouldRediscover("s1"));
    REQUIRE(fx.catalog.discoverIfStale("s1").has_value());
    CHECK(!*fx.catalog.shouldRediscover("s1"));

    transport->respondWith(toolList({ "a", "b" }));
    fx.now += 5min;
    CHECK(*fx.catalog.discoverIfStale("s1") == 1);

    fx.now += ToolCatalog::CacheLifetime;
    CHECK(*fx.catalog.discoverIfStale("s1") == 2);

    CHECK(fx.catalog.shouldRediscover("ghost").error().code == ErrorCode::NotFound);
}

TEST_CASE("ToolCatalog recordUsage counts calls", "[catalog]")
{
    auto fx = CatalogFixture {};
    fx.addServer("s1", "u1")->respondWith(toolList({ "a" }));
    REQUIRE(fx.catalog.discover("s1").has_value());

    REQUIRE(fx.catalog.recordUsage("s1", "a").has_value());
    auto tools = fx.catalog.listForServer("s1");
    CHECK(tools->front().usageCount == 1);
    CHECK(tools->front().lastUsedAt == fx.now);

    CHECK(!fx.catalog.recordUsage("s1", "nope").has_value());
}
