// SPDX-License-Identifier: Apache-2.0
#include <approval/ApprovalPolicy.hpp>
#include <chat/ExecutionOrchestrator.hpp>
#include <chat/ToolExecutor.hpp>
#include <store/InMemoryStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace mcphub;

namespace
{

class FakeInvoker: public ToolInvoker
{
  public:
    auto invoke(const ToolInvocation& invocation) -> Result<ToolOutcome> override
    {
        calls.push_back(invocation);
        return response;
    }

    Result<ToolOutcome> response = ToolOutcome {
        .success = true,
        .result = nlohmann::json { { "content", nlohmann::json::array() } },
    };
    std::vector<ToolInvocation> calls;
};

struct OrchestratorFixture
{
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<ApprovalPolicy> policy = std::make_shared<ApprovalPolicy>(store);
    std::shared_ptr<FakeInvoker> invoker = std::make_shared<FakeInvoker>();
    ExecutionOrchestrator orchestrator { store, policy, invoker };
    std::vector<StreamEvent> events;
    EventSink sink = [this](const StreamEvent& event) { events.push_back(event); };

    auto names() const -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        for (auto const& event: events)
            result.emplace_back(eventName(event));
        return result;
    }

    /// Creates an assistant message whose last content is a pending call to S1/toolX.
    auto parkToolCall() -> std::pair<std::string, std::string>
    {
        auto message = store->createMessage("c1", Role::Assistant);
        REQUIRE(message.has_value());
        auto const request = ToolCallRequest {
            .toolName = "toolX",
            .serverId = "S1",
            .arguments = { { "city", "Berlin" } },
        };
        REQUIRE(orchestrator.handleToolRequest(request, message->id, "c1", "u1", sink));
        auto contentId = std::get<ToolCallPendingApproval>(events.back()).messageContentId;
        events.clear();
        return { message->id, contentId };
    }

    void approve()
    {
        auto const request = ConversationApprovalRequest { .serverId = "S1", .toolName = "toolX", .approved = true };
        REQUIRE(policy->setConversation("u1", "c1", request).has_value());
    }
};

} // namespace

TEST_CASE("ExecutionOrchestrator parks a proposed tool call", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    auto message = fx.store->createMessage("c1", Role::Assistant);
    auto const request = ToolCallRequest { .toolName = "toolX", .serverId = "S1", .arguments = { { "a", 1 } } };

    CHECK(fx.orchestrator.handleToolRequest(request, message->id, "c1", "u1", fx.sink));
    CHECK(fx.names() == std::vector<std::string> { "newMessageContent", "toolCallPendingApproval" });

    auto const& announced = std::get<NewMessageContent>(fx.events[0]);
    auto const& pending = std::get<ToolCallPendingApproval>(fx.events[1]);
    CHECK(announced.messageContentId == pending.messageContentId);
    CHECK(pending.arguments["a"] == 1);

    auto content = fx.store->getContent(pending.messageContentId);
    REQUIRE(content->has_value());
    CHECK((*content)->kind == ContentKind::ToolCallPendingApproval);
    CHECK((*content)->payload["is_approved"].is_null());
    CHECK(fx.invoker->calls.empty());
}

TEST_CASE("ExecutionOrchestrator reports a pending call that cannot be saved", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    auto const request = ToolCallRequest { .toolName = "toolX", .serverId = "S1", .arguments = {} };

    CHECK(!fx.orchestrator.handleToolRequest(request, "no-such-message", "c1", "u1", fx.sink));
    REQUIRE(fx.events.size() == 1);
    auto const& error = std::get<StreamError>(fx.events[0]);
    CHECK(error.code == streamcode::SystemDatabaseError);
    CHECK(error.message.starts_with("Failed to save pending approval"));
}

TEST_CASE("ExecutionOrchestrator continues when nothing is pending", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(!outcome.needsApproval);
    CHECK(outcome.continueLoop);

    auto message = fx.store->createMessage("c1", Role::Assistant);
    REQUIRE(fx.store->appendContent(message->id, ContentKind::Text, { { "text", "hello" } }).has_value());
    outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(!outcome.needsApproval);
    CHECK(outcome.continueLoop);
    CHECK(fx.events.empty());
}

TEST_CASE("ExecutionOrchestrator halts on an unapproved pending call", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    fx.parkToolCall();

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(outcome.needsApproval);
    CHECK(!outcome.continueLoop);
    CHECK(fx.names() == std::vector<std::string> { "toolCallPendingApproval" });
    CHECK(fx.invoker->calls.empty());
}

TEST_CASE("ExecutionOrchestrator executes an approved call and emits in order", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    auto const messageId = fx.parkToolCall().first;
    fx.approve();

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(outcome.needsApproval);
    CHECK(outcome.continueLoop);
    CHECK(outcome.executedMessageId == messageId);

    REQUIRE(fx.names()
            == std::vector<std::string> { "newMessageContent", "toolCall", "newMessageContent", "toolResult" });

    auto const& call = std::get<ToolCall>(fx.events[1]);
    auto const& result = std::get<ToolResult>(fx.events[3]);
    CHECK(call.callId == result.callId);
    CHECK(call.arguments["city"] == "Berlin");
    CHECK(result.success);
    CHECK(result.result.contains("content"));

    REQUIRE(fx.invoker->calls.size() == 1);
    CHECK(fx.invoker->calls[0].callId == call.callId);
    CHECK(fx.invoker->calls[0].conversationId == "c1");

    auto latest = fx.store->latestMessage("c1", Role::Assistant);
    REQUIRE(latest->has_value());
    REQUIRE((*latest)->contents.size() == 3);
    CHECK((*latest)->contents[1].kind == ContentKind::ToolCall);
    CHECK((*latest)->contents[2].kind == ContentKind::ToolResult);

    // The pending call is no longer last; a new turn does not run it again.
    fx.events.clear();
    auto again = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(!again.needsApproval);
    CHECK(fx.invoker->calls.size() == 1);
}

TEST_CASE("ExecutionOrchestrator records a failed invocation as a result", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    fx.parkToolCall();
    fx.approve();
    fx.invoker->response = makeError(ErrorCode::TransportError, "pipe closed");

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(outcome.continueLoop);
    REQUIRE(fx.events.size() == 4);

    auto const& result = std::get<ToolResult>(fx.events[3]);
    CHECK(!result.success);
    CHECK(result.errorMessage == "Tool execution failed: pipe closed");
    CHECK(result.result["error"] == "execution_failed");
    CHECK(result.result.contains("duration_ms"));
}

TEST_CASE("ExecutionOrchestrator passes tool-reported errors through", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    fx.parkToolCall();
    fx.approve();
    fx.invoker->response = ToolOutcome {
        .success = false,
        .result = nlohmann::json { { "isError", true } },
        .errorMessage = "city not found",
    };

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(outcome.continueLoop);
    auto const& result = std::get<ToolResult>(fx.events.back());
    CHECK(!result.success);
    CHECK(result.errorMessage == "city not found");
    CHECK(result.result["isError"] == true);
}

TEST_CASE("ExecutionOrchestrator rejects invalid pending data", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    auto message = fx.store->createMessage("c1", Role::Assistant);
    auto const payload = nlohmann::json { { "server_id", "S1" }, { "arguments", nlohmann::json::object() } };
    REQUIRE(fx.store->appendContent(message->id, ContentKind::ToolCallPendingApproval, payload).has_value());

    auto outcome = fx.orchestrator.gatePendingCall("u1", "c1", fx.sink);
    CHECK(outcome.needsApproval);
    CHECK(!outcome.continueLoop);
    REQUIRE(fx.events.size() == 1);
    auto const& error = std::get<StreamError>(fx.events[0]);
    CHECK(error.code == streamcode::SystemInternalError);
    CHECK(error.message == "Invalid pending approval data");
}

TEST_CASE("ExecutionOrchestrator approvePending patches the content and stores the decision", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    auto const contentId = fx.parkToolCall().second;

    auto record = fx.orchestrator.approvePending("u1", "c1", contentId, true);
    REQUIRE(record.has_value());
    CHECK(record->conversationId == "c1");
    CHECK(record->approved);

    auto content = fx.store->getContent(contentId);
    CHECK((*content)->payload["is_approved"] == true);

    auto decision = fx.policy->check("u1", "c1", "S1", "toolX");
    REQUIRE(decision->has_value());
    CHECK((*decision)->source == ApprovalSource::Conversation);

    CHECK(fx.orchestrator.gatePendingCall("u1", "c1", fx.sink).continueLoop);
    CHECK(fx.invoker->calls.size() == 1);
}

TEST_CASE("ExecutionOrchestrator approvePending validates the content", "[orchestrator]")
{
    auto fx = OrchestratorFixture {};
    CHECK(fx.orchestrator.approvePending("u1", "c1", "missing", true).error().code == ErrorCode::NotFound);

    auto message = fx.store->createMessage("c1", Role::Assistant);
    auto text = fx.store->appendContent(message->id, ContentKind::Text, { { "text", "hi" } });
    CHECK(fx.orchestrator.approvePending("u1", "c1", text->id, true).error().code
          == ErrorCode::InvalidPendingApprovalData);
}

TEST_CASE("StreamEvent serializes to the wire form", "[orchestrator]")
{
    auto const pending = toJson(ToolCallPendingApproval {
        .messageContentId = "mc1",
        .messageId = "m1",
        .toolName = "toolX",
        .serverId = "S1",
        .arguments = { { "q", "x" } },
    });
    CHECK(pending["event"] == "toolCallPendingApproval");
    CHECK(pending["data"]["message_content_id"] == "mc1");
    CHECK(pending["data"]["arguments"]["q"] == "x");

    auto const result = toJson(ToolResult { .callId = "call", .result = nlohmann::json::object(), .success = true });
    CHECK(result["event"] == "toolResult");
    CHECK(result["data"]["error_message"].is_null());

    auto const error = toJson(StreamError { .code = "SYSTEM_INTERNAL_ERROR", .message = "boom" });
    CHECK(error["event"] == "error");
    CHECK(error["data"]["code"] == "SYSTEM_INTERNAL_ERROR");
    CHECK(error["data"]["error"] == "boom");
}

TEST_CASE("parsePendingToolCall validates payloads", "[orchestrator]")
{
    auto const good = toPayload(PendingToolCall { .toolName = "t", .serverId = "s", .arguments = {} });
    auto parsed = parsePendingToolCall(good);
    REQUIRE(parsed.has_value());
    CHECK(!parsed->isApproved.has_value());

    auto wrongType = good;
    wrongType["is_approved"] = "yes";
    CHECK(parsePendingToolCall(wrongType).error().code == ErrorCode::InvalidPendingApprovalData);

    auto noArguments = good;
    noArguments.erase("arguments");
    CHECK(!parsePendingToolCall(noArguments).has_value());

    CHECK(!parsePendingToolCall(nlohmann::json::array()).has_value());
}
