// SPDX-License-Identifier: Apache-2.0
#include <store/InMemoryStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <format>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

auto descriptor(std::string id) -> ServerDescriptor
{
    return ServerDescriptor { .id = id, .name = id, .displayName = id, .command = "cat" };
}

auto tool(std::string serverId, std::string name) -> ToolDescriptor
{
    return ToolDescriptor {
        .serverId = std::move(serverId),
        .name = std::move(name),
        .description = {},
        .inputSchema = { { "type", "object" } },
        .discoveredAt = clock::now(),
    };
}

auto approval(std::string id, std::optional<std::string> conversationId) -> ApprovalRecord
{
    auto const isGlobal = !conversationId.has_value();
    return ApprovalRecord {
        .id = std::move(id),
        .userId = "u1",
        .conversationId = std::move(conversationId),
        .serverId = "s1",
        .toolName = "echo",
        .approved = true,
        .autoApprove = isGlobal,
        .isGlobal = isGlobal,
    };
}

} // namespace

TEST_CASE("InMemoryStore upsert keeps runtime columns", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.upsertServer(descriptor("s1")).has_value());
    auto const running = RuntimeUpdate { .status = ServerStatus::Running, .isActive = true, .processId = 77 };
    REQUIRE(store.updateRuntime("s1", running).has_value());

    auto changed = descriptor("s1");
    changed.displayName = "Renamed";
    REQUIRE(store.upsertServer(changed).has_value());

    auto record = store.getServer("s1");
    REQUIRE(record.has_value());
    REQUIRE(record->has_value());
    CHECK((*record)->descriptor.displayName == "Renamed");
    CHECK((*record)->runtime.status == ServerStatus::Running);
    CHECK((*record)->runtime.processId == 77);
}

TEST_CASE("InMemoryStore reports unknown servers", "[store]")
{
    auto store = InMemoryStore {};

    auto missing = store.getServer("nope");
    REQUIRE(missing.has_value());
    CHECK(!missing->has_value());

    auto update = store.updateRuntime("nope", RuntimeUpdate {});
    REQUIRE(!update.has_value());
    CHECK(update.error().code == ErrorCode::NotFound);

    CHECK(store.upsertServer(descriptor("")).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("InMemoryStore recordRestart counts restarts", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.upsertServer(descriptor("s1")).has_value());

    auto const at = clock::now();
    REQUIRE(store.recordRestart("s1", at).has_value());
    REQUIRE(store.recordRestart("s1", at + 1s).has_value());

    auto record = store.getServer("s1");
    CHECK((*record)->runtime.restartCount == 2);
    CHECK((*record)->runtime.lastRestartAt == at + 1s);
}

TEST_CASE("InMemoryStore replaceTools swaps the whole set or nothing", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.replaceTools("s1", { tool("s1", "a"), tool("s1", "b") }).has_value());
    REQUIRE(store.replaceTools("s2", { tool("s2", "a") }).has_value());

    auto bad = store.replaceTools("s1", { tool("s1", "c"), tool("s1", "") });
    REQUIRE(!bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
    CHECK(store.listTools("s1")->size() == 2);

    REQUIRE(store.replaceTools("s1", { tool("s1", "c") }).has_value());
    auto tools = store.listTools("s1");
    REQUIRE(tools->size() == 1);
    CHECK(tools->front().name == "c");

    CHECK(store.findTools("a")->size() == 1);
    CHECK(store.listTools("s2")->size() == 1);
}

TEST_CASE("InMemoryStore removeServer drops its tools", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.upsertServer(descriptor("s1")).has_value());
    REQUIRE(store.replaceTools("s1", { tool("s1", "a") }).has_value());

    REQUIRE(store.removeServer("s1").has_value());
    CHECK(store.listTools("s1")->empty());
    CHECK(store.removeServer("s1").error().code == ErrorCode::NotFound);
}

TEST_CASE("InMemoryStore incrementUsage tracks count and time", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.replaceTools("s1", { tool("s1", "a") }).has_value());

    auto const at = clock::now();
    REQUIRE(store.incrementUsage("s1", "a", at).has_value());
    REQUIRE(store.incrementUsage("s1", "a", at).has_value());

    auto tools = store.listTools("s1");
    CHECK(tools->front().usageCount == 2);
    CHECK(tools->front().lastUsedAt == at);

    CHECK(store.incrementUsage("s1", "missing", at).error().code == ErrorCode::NotFound);
}

TEST_CASE("InMemoryStore enforces approval scope and uniqueness", "[store]")
{
    auto store = InMemoryStore {};
    REQUIRE(store.saveApproval(approval("g1", std::nullopt)).has_value());
    REQUIRE(store.saveApproval(approval("c1", "conv-1")).has_value());

    CHECK(store.saveApproval(approval("g2", std::nullopt)).error().code == ErrorCode::StorageError);
    CHECK(store.saveApproval(approval("c2", "conv-1")).error().code == ErrorCode::StorageError);
    REQUIRE(store.saveApproval(approval("c3", "conv-2")).has_value());

    auto inconsistent = approval("x", std::nullopt);
    inconsistent.isGlobal = false;
    CHECK(store.saveApproval(inconsistent).error().code == ErrorCode::InvalidArgument);

    auto global = store.findGlobal("u1", "s1", "echo");
    REQUIRE(global->has_value());
    CHECK((*global)->id == "g1");

    auto conversation = store.findConversation("u1", "conv-1", "s1", "echo");
    REQUIRE(conversation->has_value());
    CHECK((*conversation)->id == "c1");

    CHECK(store.listConversationApprovals("u1", "conv-1")->size() == 1);
    CHECK(*store.removeApproval("c1"));
    CHECK(!*store.removeApproval("c1"));
}

TEST_CASE("InMemoryStore deletes expired approvals only", "[store]")
{
    auto store = InMemoryStore {};
    auto const now = clock::now();

    auto expired = approval("c1", "conv-1");
    expired.expiresAt = now - 1s;
    auto current = approval("c2", "conv-2");
    current.expiresAt = now + 1h;
    auto forever = approval("g1", std::nullopt);

    REQUIRE(store.saveApproval(expired).has_value());
    REQUIRE(store.saveApproval(current).has_value());
    REQUIRE(store.saveApproval(forever).has_value());

    auto removed = store.deleteExpiredApprovals(now);
    REQUIRE(removed.has_value());
    CHECK(*removed == 1);
    CHECK(!store.findConversation("u1", "conv-1", "s1", "echo")->has_value());
    CHECK(store.findConversation("u1", "conv-2", "s1", "echo")->has_value());
}

TEST_CASE("InMemoryStore orders message contents and finds the latest message", "[store]")
{
    auto store = InMemoryStore {};
    auto first = store.createMessage("conv", Role::Assistant);
    auto user = store.createMessage("conv", Role::User);
    auto second = store.createMessage("conv", Role::Assistant);
    REQUIRE(first.has_value());
    REQUIRE(user.has_value());
    REQUIRE(second.has_value());

    auto a = store.appendContent(second->id, ContentKind::Text, { { "text", "hi" } });
    auto b = store.appendContent(second->id, ContentKind::ToolCall, { { "call_id", "c" } });
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->sequenceOrder == 0);
    CHECK(b->sequenceOrder == 1);

    auto latest = store.latestMessage("conv", Role::Assistant);
    REQUIRE(latest->has_value());
    CHECK((*latest)->id == second->id);
    CHECK((*latest)->contents.size() == 2);

    CHECK(!store.latestMessage("other", Role::Assistant)->has_value());
    CHECK(store.appendContent("missing", ContentKind::Text, {}).error().code == ErrorCode::NotFound);
}

TEST_CASE("InMemoryStore patches content payload in place", "[store]")
{
    auto store = InMemoryStore {};
    auto message = store.createMessage("conv", Role::Assistant);
    auto content =
        store.appendContent(message->id, ContentKind::ToolCallPendingApproval, { { "is_approved", nullptr } });
    REQUIRE(content.has_value());

    REQUIRE(store.updateContentPayload(content->id, { { "is_approved", true } }).has_value());

    auto loaded = store.getContent(content->id);
    REQUIRE(loaded->has_value());
    CHECK((*loaded)->payload["is_approved"] == true);
    CHECK((*loaded)->sequenceOrder == 0);

    CHECK(!store.getContent("missing")->has_value());
    CHECK(store.updateContentPayload("missing", {}).error().code == ErrorCode::NotFound);
}

TEST_CASE("InMemoryStore filters and paginates execution logs newest first", "[store]")
{
    auto store = InMemoryStore {};
    auto const base = clock::now();

    for (auto i = 0; i < 5; ++i)
    {
        auto entry = ExecutionLogEntry {
            .id = std::format("log-{}", i),
            .userId = i % 2 == 0 ? "u1" : "u2",
            .serverId = "s1",
            .toolName = "echo",
            .status = ExecutionStatus::Completed,
            .startedAt = base + std::chrono::seconds(i),
        };
        REQUIRE(store.insertExecutionLog(entry).has_value());
    }

    auto duplicate = ExecutionLogEntry { .id = "log-0" };
    CHECK(store.insertExecutionLog(duplicate).error().code == ErrorCode::StorageError);

    auto all = store.listExecutionLogs(ExecutionLogFilter {});
    REQUIRE(all->size() == 5);
    CHECK(all->front().id == "log-4");

    auto u1 = store.listExecutionLogs(ExecutionLogFilter { .userId = "u1" });
    CHECK(u1->size() == 3);

    auto page2 = store.listExecutionLogs(ExecutionLogFilter { .page = 2, .perPage = 2 });
    REQUIRE(page2->size() == 2);
    CHECK(page2->front().id == "log-2");

    CHECK(store.listExecutionLogs(ExecutionLogFilter { .page = 9 })->empty());

    auto failed = ExecutionLogEntry { .id = "log-1", .status = ExecutionStatus::Failed, .startedAt = base + 1s };
    REQUIRE(store.updateExecutionLog(failed).has_value());
    auto onlyFailed = store.listExecutionLogs(ExecutionLogFilter { .status = ExecutionStatus::Failed });
    REQUIRE(onlyFailed->size() == 1);
    CHECK(onlyFailed->front().id == "log-1");
}
