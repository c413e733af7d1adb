#include "network/nwEvents.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace banchess::gtest {

using nlohmann::json;

static rules::Move uci(std::string_view text) {
	return *rules::moveFromUci(text);
}

TEST(NetworkMessages, ClientToMessage) {
	EXPECT_EQ(json::parse(network::toMessage(network::ClientAuthenticate{.userId = "u1", .username = "Alice", .token = ""})),
	          json({{"type", "authenticate"}, {"userId", "u1"}, {"username", "Alice"}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientLeaveQueue{})), json({{"type", "leave-queue"}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientAttach{.sessionId = "s-1"})), json({{"type", "attach"}, {"sessionId", "s-1"}}));

	EXPECT_EQ(json::parse(network::toMessage(network::ClientAction{
	                  .sessionId = "s-1",
	                  .action    = rules::Action{.type = rules::ActionType::Ban, .move = uci("e2e4")},
	          })),
	          json({{"type", "action"}, {"sessionId", "s-1"}, {"ban", {{"from", "e2"}, {"to", "e4"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientAction{
	                  .sessionId = "s-1",
	                  .action    = rules::Action{.type = rules::ActionType::Move, .move = uci("e7e8n")},
	          })),
	          json({{"type", "action"}, {"sessionId", "s-1"}, {"move", {{"from", "e7"}, {"to", "e8"}, {"promotion", "n"}}}}));
}

TEST(NetworkMessages, TimeControlRequests) {
	// Omitted: server default. Null: untimed.
	EXPECT_EQ(json::parse(network::toMessage(network::ClientJoinQueue{.timeControl = std::nullopt})), json({{"type", "join-queue"}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientJoinQueue{.timeControl = std::optional<engine::TimeControl>{}})),
	          json({{"type", "join-queue"}, {"timeControl", nullptr}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientCreateSolo{
	                  .timeControl = std::optional<engine::TimeControl>{engine::TimeControl{.initialSeconds = 300, .incrementSeconds = 5}}})),
	          json({{"type", "create-solo-game"}, {"timeControl", {{"initial", 300}, {"increment", 5}}}}));

	const auto byDefault = network::fromClientMessage(R"({"type":"join-queue"})");
	ASSERT_TRUE(byDefault.has_value());
	EXPECT_FALSE(std::get<network::ClientJoinQueue>(*byDefault).timeControl.has_value());

	const auto untimed = network::fromClientMessage(R"({"type":"join-queue","timeControl":null})");
	ASSERT_TRUE(untimed.has_value());
	const auto& untimedRequest = std::get<network::ClientJoinQueue>(*untimed).timeControl;
	ASSERT_TRUE(untimedRequest.has_value());
	EXPECT_FALSE(untimedRequest->has_value());

	const auto timed = network::fromClientMessage(R"({"type":"create-solo-game","timeControl":{"initial":60}})");
	ASSERT_TRUE(timed.has_value());
	const auto& timedRequest = std::get<network::ClientCreateSolo>(*timed).timeControl;
	ASSERT_TRUE(timedRequest.has_value() && timedRequest->has_value());
	EXPECT_EQ(**timedRequest, (engine::TimeControl{.initialSeconds = 60, .incrementSeconds = 0}));
}

TEST(NetworkMessages, TimeValuesAreBounded) {
	const auto parses = [](const std::string& message) { return network::fromClientMessage(message).has_value(); };

	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":0}})"));
	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":-1}})"));
	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":60.5}})"));
	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":10801}})"));
	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":60,"increment":-2}})"));
	EXPECT_FALSE(parses(R"({"type":"join-queue","timeControl":{"initial":60,"increment":181}})"));
	EXPECT_TRUE(parses(R"({"type":"join-queue","timeControl":{"initial":10800,"increment":180}})"));

	EXPECT_FALSE(parses(R"({"type":"give-time","sessionId":"s","seconds":-1})"));
	EXPECT_FALSE(parses(R"({"type":"give-time","sessionId":"s","seconds":0})"));
	EXPECT_FALSE(parses(R"({"type":"give-time","sessionId":"s","seconds":4294967295})"));
	EXPECT_TRUE(parses(R"({"type":"give-time","sessionId":"s","seconds":300})"));
}

TEST(NetworkMessages, ClientFromMessageValid) {
	const auto auth = network::fromClientMessage(R"({"type":"authenticate","userId":"u1","username":"Alice","token":"t"})");
	ASSERT_TRUE(auth.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientAuthenticate>(*auth));
	EXPECT_EQ(std::get<network::ClientAuthenticate>(*auth).token, "t");

	const auto ban = network::fromClientMessage(R"({"type":"action","sessionId":"s-1","ban":{"from":"e2","to":"e4"}})");
	ASSERT_TRUE(ban.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientAction>(*ban));
	const auto banEvent = std::get<network::ClientAction>(*ban);
	EXPECT_EQ(banEvent.sessionId, "s-1");
	EXPECT_EQ(banEvent.action, (rules::Action{.type = rules::ActionType::Ban, .move = uci("e2e4")}));

	const auto promotion = network::fromClientMessage(R"({"type":"action","sessionId":"s-1","move":{"from":"a7","to":"a8","promotion":"r"}})");
	ASSERT_TRUE(promotion.has_value());
	EXPECT_EQ(std::get<network::ClientAction>(*promotion).action.move, uci("a7a8r"));

	const auto giveTime = network::fromClientMessage(R"({"type":"give-time","sessionId":"s-1"})");
	ASSERT_TRUE(giveTime.has_value());
	EXPECT_FALSE(std::get<network::ClientGiveTime>(*giveTime).seconds.has_value());

	for (const auto* message: {R"({"type":"leave-queue"})", R"({"type":"detach"})", R"({"type":"ping"})", R"({"type":"resign","sessionId":"s"})",
	                           R"({"type":"offer-draw","sessionId":"s"})", R"({"type":"accept-draw","sessionId":"s"})"}) {
		EXPECT_TRUE(network::fromClientMessage(message).has_value()) << message;
	}
}

TEST(NetworkMessages, ClientFromMessageInvalid) {
	EXPECT_FALSE(network::fromClientMessage("not-json").has_value());
	EXPECT_FALSE(network::fromClientMessage("[1,2]").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"unknown"})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":42})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"authenticate","userId":"u1"})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"attach"})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"action","sessionId":"s"})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"action","sessionId":"s","ban":{"from":"e2","to":"e4"},"move":{"from":"e2","to":"e4"}})")
	                     .has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"action","sessionId":"s","move":{"from":"z9","to":"e4"}})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"action","sessionId":"s","move":{"from":"e7","to":"e8","promotion":"k"}})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"give-time","sessionId":"s","seconds":"ten"})").has_value());
	EXPECT_FALSE(network::fromClientMessage(R"({"type":"join-queue","timeControl":{"increment":2}})").has_value());
}

TEST(NetworkMessages, ServerToMessage) {
	EXPECT_EQ(json::parse(network::toMessage(network::ServerQueuePosition{.position = 3})), json({{"type", "queue-position"}, {"position", 3}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerPong{})), json({{"type", "pong"}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerError{.code = engine::ErrorCode::NotYourTurn, .message = "Wait."})),
	          json({{"type", "error"}, {"code", "not-your-turn"}, {"message", "Wait."}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerMatched{
	                  .sessionId = "s-1",
	                  .color     = rules::Color::Black,
	                  .opponent  = {.userId = "u2", .displayName = "Bob"},
	          })),
	          json({{"type", "matched"}, {"sessionId", "s-1"}, {"color", "black"}, {"opponent", {{"userId", "u2"}, {"username", "Bob"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerQueueLeft{.result = network::QueueLeftResult::AlreadyMatched, .sessionId = "s-1"})),
	          json({{"type", "queue-left"}, {"result", "already-matched"}, {"sessionId", "s-1"}}));
}

TEST(NetworkMessages, ServerFromMessage) {
	const auto authenticated = network::fromServerMessage(R"({"type":"authenticated","userId":"u1","username":"Alice","activeSessions":["a-1"]})");
	ASSERT_TRUE(authenticated.has_value());
	const auto& auth = std::get<network::ServerAuthenticated>(*authenticated);
	EXPECT_EQ(auth.identity.displayName, "Alice");
	EXPECT_EQ(auth.activeSessions, std::vector<std::string>{"a-1"});

	const auto created = network::fromServerMessage(R"({"type":"game-created","sessionId":"s-1","timeControl":null})");
	ASSERT_TRUE(created.has_value());
	EXPECT_FALSE(std::get<network::ServerGameCreated>(*created).timeControl.has_value());

	const auto left = network::fromServerMessage(R"({"type":"queue-left","result":"left"})");
	ASSERT_TRUE(left.has_value());
	EXPECT_EQ(std::get<network::ServerQueueLeft>(*left).result, network::QueueLeftResult::Left);

	EXPECT_FALSE(network::fromServerMessage(R"({"type":"error","code":"no-such-code"})").has_value());
	EXPECT_FALSE(network::fromServerMessage(R"({"type":"matched","sessionId":"s","color":"green","opponent":{"userId":"u","username":"U"}})")
	                     .has_value());
	EXPECT_FALSE(network::fromServerMessage(R"({"type":"queue-left","result":"maybe"})").has_value());
}

TEST(NetworkMessages, StateCarriesTheFullView) {
	const auto timestamp = engine::SystemTime{} + std::chrono::milliseconds(1'700'000'000'123);
	const engine::SessionView view{
	        .sessionId     = "s-1",
	        .mode          = engine::GameMode::Online,
	        .white         = {.userId = "u1", .displayName = "Alice"},
	        .black         = {.userId = "u2", .displayName = "Bob"},
	        .timeControl   = engine::TimeControl{.initialSeconds = 300, .incrementSeconds = 0},
	        .role          = engine::Seat::White,
	        .fen           = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 move:e2e4",
	        .history       = {engine::HistoryEntry{
	                      .ply       = 1,
	                      .color     = rules::Color::Black,
	                      .action    = rules::Action{.type = rules::ActionType::Ban, .move = uci("e2e4")},
	                      .timestamp = timestamp,
	                      .fenAfter  = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 move:e2e4",
	        }},
	        .pending       = rules::ActionType::Move,
	        .actor         = rules::Color::White,
	        .legalActions  = {uci("d2d4"), uci("g1f3")},
	        .inCheck       = false,
	        .status        = engine::SessionStatus::Active,
	        .result        = std::nullopt,
	        .clock         = engine::ClockState{.white = std::chrono::milliseconds(299'500), .black = std::chrono::milliseconds(298'000),
	                                            .running = rules::Color::White},
	        .drawOfferedBy = rules::Color::Black,
	        .version       = 2,
	};

	const auto message = network::toMessage(network::ServerState{.view = view});
	const auto j       = json::parse(message);
	EXPECT_EQ(j.at("type"), "state");
	EXPECT_EQ(j.at("role"), "white");
	EXPECT_EQ(j.at("pending"), "move");
	EXPECT_EQ(j.at("actor"), "white");
	EXPECT_EQ(j.at("legalActions"), json({"d2d4", "g1f3"}));
	EXPECT_EQ(j.at("history")[0].at("bcn"), "b:e2e4");
	EXPECT_EQ(j.at("history")[0].at("timestamp"), 1'700'000'000'123);
	EXPECT_EQ(j.at("clock").at("white"), 299'500);
	EXPECT_EQ(j.at("clock").at("running"), "white");
	EXPECT_EQ(j.at("drawOfferedBy"), "black");
	EXPECT_TRUE(j.at("result").is_null());

	const auto parsed = network::fromServerMessage(message);
	ASSERT_TRUE(parsed.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ServerState>(*parsed));
	EXPECT_EQ(std::get<network::ServerState>(*parsed).view, view);
}

TEST(NetworkMessages, SeatNames) {
	EXPECT_EQ(network::toString(engine::Seat::White), "white");
	EXPECT_EQ(network::toString(engine::Seat::Black), "black");
	EXPECT_EQ(network::toString(engine::Seat::White | engine::Seat::Black), "both");
	EXPECT_EQ(network::toString(engine::Seat::Observer), "spectator");
	EXPECT_EQ(network::toString(engine::Seat::None), "none");
}

} // namespace banchess::gtest
