#include "banchess/multiplexer.hpp"
#include "fakeTransport.hpp"

#include "rules/banChessRules.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace banchess::gtest {

using engine::ErrorCode;
using engine::Seat;
using engine::SessionStatus;
using network::ServerError;
using network::ServerState;

static rules::Action ban(std::string_view uci) {
	return rules::Action{.type = rules::ActionType::Ban, .move = *rules::moveFromUci(uci)};
}
static rules::Action move(std::string_view uci) {
	return rules::Action{.type = rules::ActionType::Move, .move = *rules::moveFromUci(uci)};
}

class MultiplexerTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_timers.start();
		m_registry   = std::make_unique<engine::SessionRegistry>(std::make_shared<const rules::BanChessRules>(), m_timers, nullptr, m_retireDelay);
		m_matchmaker = std::make_unique<engine::Matchmaker>(*m_registry);
		m_multiplexer = std::make_unique<server::Multiplexer>(m_transport, *m_registry, *m_matchmaker, m_authenticator, m_timers,
		                                                      server::Multiplexer::Options{
		                                                              .graceWindow        = std::chrono::milliseconds(500),
		                                                              .defaultTimeControl = std::nullopt,
		                                                              .giveTimeSeconds    = 15,
		                                                      });
		ASSERT_TRUE(m_registry->registerObserver(m_multiplexer.get()));
		m_multiplexer->start();
	}

	void TearDown() override {
		m_multiplexer->stop();
		m_registry->shutdown();
		m_timers.stop();
	}

	void sendFrom(ConnectionId connectionId, const network::ClientEvent& event) {
		m_multiplexer->onMessage(connectionId, network::toMessage(event));
	}

	//! Open a connection and authenticate it as the given user.
	ConnectionId login(const std::string& userId) {
		const auto connectionId = m_nextConnection++;
		m_multiplexer->onConnect(connectionId);
		sendFrom(connectionId, network::ClientAuthenticate{.userId = userId, .username = userId, .token = {}});
		EXPECT_TRUE(m_transport.next<network::ServerAuthenticated>(connectionId));
		return connectionId;
	}

	//! Wait for the next error on a connection and return its code.
	ErrorCode nextError(ConnectionId connectionId) {
		const auto error = m_transport.next<ServerError>(connectionId);
		return error ? error->code : ErrorCode::None;
	}

	//! Wait for a snapshot of at least the given version.
	std::optional<ServerState> stateAt(ConnectionId connectionId, std::uint64_t version) {
		return m_transport.next<ServerState>(connectionId, [&](const ServerState& s) { return s.view.version >= version; });
	}

	//! Pair two players through the queue. White queues first.
	engine::SessionId match(ConnectionId white, ConnectionId black) {
		sendFrom(white, network::ClientJoinQueue{});
		sendFrom(black, network::ClientJoinQueue{});
		const auto whiteMatch = m_transport.next<network::ServerMatched>(white);
		const auto blackMatch = m_transport.next<network::ServerMatched>(black);
		if (!whiteMatch || !blackMatch) {
			ADD_FAILURE() << "No match notification.";
			return {};
		}
		EXPECT_EQ(whiteMatch->sessionId, blackMatch->sessionId);
		return whiteMatch->sessionId;
	}

	std::chrono::milliseconds m_retireDelay{std::chrono::seconds(60)};
	engine::TimerService m_timers;
	FakeTransport m_transport;
	engine::GuestAuthenticator m_authenticator;
	std::unique_ptr<engine::SessionRegistry> m_registry;
	std::unique_ptr<engine::Matchmaker> m_matchmaker;
	std::unique_ptr<server::Multiplexer> m_multiplexer;
	ConnectionId m_nextConnection{1};
};

TEST_F(MultiplexerTest, AuthenticationGate) {
	m_multiplexer->onConnect(1);
	sendFrom(1, network::ClientPing{});
	EXPECT_EQ(nextError(1), ErrorCode::NotAuthenticated);
	m_multiplexer->onMessage(1, "not json");
	EXPECT_EQ(nextError(1), ErrorCode::MalformedMessage);
	sendFrom(1, network::ClientAuthenticate{.userId = "bad id!", .username = "Alice", .token = {}});
	EXPECT_EQ(nextError(1), ErrorCode::AuthFailed);

	sendFrom(1, network::ClientAuthenticate{.userId = "alice", .username = "Alice", .token = {}});
	const auto authenticated = m_transport.next<network::ServerAuthenticated>(1);
	ASSERT_TRUE(authenticated);
	EXPECT_EQ(authenticated->identity.userId, "alice");
	EXPECT_EQ(authenticated->identity.displayName, "Alice");
	EXPECT_TRUE(authenticated->activeSessions.empty());

	sendFrom(1, network::ClientAuthenticate{.userId = "alice", .username = "Alice", .token = {}});
	EXPECT_EQ(nextError(1), ErrorCode::AlreadyAuthenticated);
	sendFrom(1, network::ClientPing{});
	EXPECT_TRUE(m_transport.next<network::ServerPong>(1));
}

TEST_F(MultiplexerTest, SoloGameFlow) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientCreateSolo{});
	const auto created = m_transport.next<network::ServerGameCreated>(alice);
	ASSERT_TRUE(created);
	EXPECT_FALSE(created->timeControl.has_value()); // Server default is untimed here.

	sendFrom(alice, network::ClientAttach{.sessionId = created->sessionId});
	const auto initial = stateAt(alice, 1);
	ASSERT_TRUE(initial);
	EXPECT_EQ(initial->view.mode, engine::GameMode::Solo);
	EXPECT_EQ(initial->view.role, Seat::White | Seat::Black);
	EXPECT_EQ(initial->view.actor, rules::Color::Black);
	EXPECT_EQ(initial->view.pending, rules::ActionType::Ban);
	EXPECT_EQ(initial->view.legalActions.size(), 20u);

	sendFrom(alice, network::ClientAction{.sessionId = created->sessionId, .action = ban("e2e4")});
	const auto banned = stateAt(alice, 2);
	ASSERT_TRUE(banned);
	EXPECT_EQ(banned->view.actor, rules::Color::White);
	EXPECT_EQ(banned->view.pending, rules::ActionType::Move);
	EXPECT_EQ(banned->view.legalActions.size(), 19u);

	sendFrom(alice, network::ClientAction{.sessionId = created->sessionId, .action = move("d2d4")});
	const auto moved = stateAt(alice, 3);
	ASSERT_TRUE(moved);
	EXPECT_EQ(moved->view.history.size(), 2u);
	EXPECT_EQ(moved->view.fen, "rnbqkbnr/pppppppp/8/8/3P4/8/PPP1PPPP/RNBQKBNR b KQkq d3 0 1 ban");
}

TEST_F(MultiplexerTest, RejectionsBecomeErrors) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientCreateSolo{});
	const auto created = m_transport.next<network::ServerGameCreated>(alice);
	ASSERT_TRUE(created);

	// Commands need an attachment to the session they name.
	sendFrom(alice, network::ClientAction{.sessionId = created->sessionId, .action = ban("e2e4")});
	EXPECT_EQ(nextError(alice), ErrorCode::NotAttached);

	sendFrom(alice, network::ClientAttach{.sessionId = created->sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	sendFrom(alice, network::ClientAction{.sessionId = created->sessionId, .action = move("e2e4")});
	EXPECT_EQ(nextError(alice), ErrorCode::WrongPhase);
	sendFrom(alice, network::ClientAction{.sessionId = created->sessionId, .action = ban("e2e5")});
	EXPECT_EQ(nextError(alice), ErrorCode::IllegalAction);
	sendFrom(alice, network::ClientOfferDraw{.sessionId = created->sessionId});
	EXPECT_EQ(nextError(alice), ErrorCode::NotAllowedInSolo);
	sendFrom(alice, network::ClientAction{.sessionId = "missing", .action = ban("e2e4")});
	EXPECT_EQ(nextError(alice), ErrorCode::NotAttached);

	sendFrom(alice, network::ClientAttach{.sessionId = "missing"});
	EXPECT_EQ(nextError(alice), ErrorCode::AlreadyAttached);

	sendFrom(alice, network::ClientDetach{});
	const auto detached = m_transport.next<network::ServerDetached>(alice);
	ASSERT_TRUE(detached);
	EXPECT_EQ(detached->sessionId, created->sessionId);
	sendFrom(alice, network::ClientDetach{});
	EXPECT_EQ(nextError(alice), ErrorCode::NotAttached);
	sendFrom(alice, network::ClientAttach{.sessionId = "missing"});
	EXPECT_EQ(nextError(alice), ErrorCode::SessionNotFound);
}

TEST_F(MultiplexerTest, QueueMatchesPlayers) {
	const auto alice = login("alice");
	const auto bob   = login("bob");

	sendFrom(alice, network::ClientJoinQueue{});
	const auto position = m_transport.next<network::ServerQueuePosition>(alice);
	ASSERT_TRUE(position);
	EXPECT_EQ(position->position, 1u);

	sendFrom(bob, network::ClientJoinQueue{});
	const auto whiteMatch = m_transport.next<network::ServerMatched>(alice);
	const auto blackMatch = m_transport.next<network::ServerMatched>(bob);
	ASSERT_TRUE(whiteMatch);
	ASSERT_TRUE(blackMatch);
	EXPECT_EQ(whiteMatch->color, rules::Color::White);
	EXPECT_EQ(whiteMatch->opponent.userId, "bob");
	EXPECT_EQ(blackMatch->color, rules::Color::Black);
	EXPECT_EQ(blackMatch->opponent.userId, "alice");
	EXPECT_EQ(whiteMatch->sessionId, blackMatch->sessionId);

	sendFrom(alice, network::ClientLeaveQueue{});
	const auto left = m_transport.next<network::ServerQueueLeft>(alice);
	ASSERT_TRUE(left);
	EXPECT_EQ(left->result, network::QueueLeftResult::AlreadyMatched);
	EXPECT_EQ(left->sessionId, whiteMatch->sessionId);

	// A new connection of a player learns about the running game.
	const auto aliceAgain = m_nextConnection++;
	m_multiplexer->onConnect(aliceAgain);
	sendFrom(aliceAgain, network::ClientAuthenticate{.userId = "alice", .username = "alice", .token = {}});
	const auto authenticated = m_transport.next<network::ServerAuthenticated>(aliceAgain);
	ASSERT_TRUE(authenticated);
	EXPECT_EQ(authenticated->activeSessions, std::vector<engine::SessionId>{whiteMatch->sessionId});
}

TEST_F(MultiplexerTest, LeaveQueue) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientLeaveQueue{});
	EXPECT_EQ(nextError(alice), ErrorCode::NotQueued);

	sendFrom(alice, network::ClientJoinQueue{});
	ASSERT_TRUE(m_transport.next<network::ServerQueuePosition>(alice));
	sendFrom(alice, network::ClientJoinQueue{.timeControl = network::TimeControlRequest{std::optional<engine::TimeControl>{engine::TimeControl{}}}});
	EXPECT_EQ(nextError(alice), ErrorCode::AlreadyQueued);

	sendFrom(alice, network::ClientLeaveQueue{});
	const auto left = m_transport.next<network::ServerQueueLeft>(alice);
	ASSERT_TRUE(left);
	EXPECT_EQ(left->result, network::QueueLeftResult::Left);
	EXPECT_FALSE(left->sessionId.has_value());
	EXPECT_FALSE(m_matchmaker->isQueued("alice"));
}

TEST_F(MultiplexerTest, RoleSpecificSnapshots) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto carol     = login("carol");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());

	for (const auto connectionId: {alice, bob, carol}) {
		sendFrom(connectionId, network::ClientAttach{.sessionId = sessionId});
	}
	const auto white     = stateAt(alice, 1);
	const auto black     = stateAt(bob, 1);
	const auto spectator = stateAt(carol, 1);
	ASSERT_TRUE(white && black && spectator);
	EXPECT_EQ(white->view.role, Seat::White);
	EXPECT_TRUE(white->view.legalActions.empty());
	EXPECT_EQ(black->view.role, Seat::Black);
	EXPECT_EQ(black->view.legalActions.size(), 20u);
	EXPECT_EQ(spectator->view.role, Seat::Observer);
	EXPECT_TRUE(spectator->view.legalActions.empty());

	// Spectators can not act.
	sendFrom(carol, network::ClientAction{.sessionId = sessionId, .action = ban("e2e4")});
	EXPECT_EQ(nextError(carol), ErrorCode::NotAPlayer);
	sendFrom(alice, network::ClientAction{.sessionId = sessionId, .action = ban("e7e5")});
	EXPECT_EQ(nextError(alice), ErrorCode::NotYourTurn);

	sendFrom(bob, network::ClientAction{.sessionId = sessionId, .action = ban("e2e4")});
	const auto whiteAfter     = stateAt(alice, 2);
	const auto spectatorAfter = stateAt(carol, 2);
	ASSERT_TRUE(whiteAfter && spectatorAfter);
	EXPECT_EQ(whiteAfter->view.legalActions.size(), 19u);
	EXPECT_EQ(spectatorAfter->view.history, whiteAfter->view.history);
	EXPECT_TRUE(stateAt(bob, 2));
}

TEST_F(MultiplexerTest, SeatIsHeldByOneConnection) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());

	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	const auto first = stateAt(alice, 1);
	ASSERT_TRUE(first);
	ASSERT_TRUE(stateAt(bob, 1));

	const auto aliceAgain = login("alice");
	sendFrom(aliceAgain, network::ClientAttach{.sessionId = sessionId});
	EXPECT_EQ(nextError(aliceAgain), ErrorCode::SeatOccupied);

	// Attaching again on the holding connection re-sends the snapshot.
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	const auto again = stateAt(alice, 1);
	ASSERT_TRUE(again);
	EXPECT_EQ(again->view, first->view);

	// Once released the seat is free for the other connection.
	sendFrom(alice, network::ClientDetach{});
	ASSERT_TRUE(m_transport.next<network::ServerDetached>(alice));
	sendFrom(aliceAgain, network::ClientAttach{.sessionId = sessionId});
	const auto taken = stateAt(aliceAgain, 1);
	ASSERT_TRUE(taken);
	EXPECT_EQ(taken->view.role, Seat::White);
}

TEST_F(MultiplexerTest, DrawAndGiveTime) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	ASSERT_TRUE(stateAt(bob, 1));

	sendFrom(alice, network::ClientGiveTime{.sessionId = sessionId, .seconds = std::nullopt});
	EXPECT_EQ(nextError(alice), ErrorCode::NoTimeControl);
	sendFrom(bob, network::ClientAcceptDraw{.sessionId = sessionId});
	EXPECT_EQ(nextError(bob), ErrorCode::NoDrawOffer);

	sendFrom(alice, network::ClientOfferDraw{.sessionId = sessionId});
	const auto offered = stateAt(bob, 2);
	ASSERT_TRUE(offered);
	EXPECT_EQ(offered->view.drawOfferedBy, rules::Color::White);

	sendFrom(bob, network::ClientAcceptDraw{.sessionId = sessionId});
	const auto drawn = stateAt(alice, 3);
	ASSERT_TRUE(drawn);
	EXPECT_EQ(drawn->view.status, SessionStatus::Finished);
	ASSERT_TRUE(drawn->view.result.has_value());
	EXPECT_EQ(drawn->view.result->reason, engine::TerminationReason::DrawAgreement);
	EXPECT_FALSE(drawn->view.result->winner.has_value());
}

TEST_F(MultiplexerTest, FinishedSessionsStayReadable) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientCreateSolo{});
	const auto created = m_transport.next<network::ServerGameCreated>(alice);
	ASSERT_TRUE(created);
	sendFrom(alice, network::ClientAttach{.sessionId = created->sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	sendFrom(alice, network::ClientResign{.sessionId = created->sessionId});
	const auto resigned = stateAt(alice, 2);
	ASSERT_TRUE(resigned);
	EXPECT_EQ(resigned->view.status, SessionStatus::Finished);

	const auto bob = login("bob");
	sendFrom(bob, network::ClientAttach{.sessionId = created->sessionId});
	const auto finished = stateAt(bob, 2);
	ASSERT_TRUE(finished);
	EXPECT_EQ(finished->view.status, SessionStatus::Finished);
	EXPECT_EQ(finished->view.role, Seat::Observer);
	EXPECT_EQ(nextError(bob), ErrorCode::SessionFinished);
}

TEST_F(MultiplexerTest, EmptySeatIsForfeited) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	ASSERT_TRUE(stateAt(bob, 1));

	m_multiplexer->onDisconnect(alice);
	const auto forfeited = m_transport.next<ServerState>(bob, [](const ServerState& s) { return s.view.status == SessionStatus::Finished; });
	ASSERT_TRUE(forfeited);
	ASSERT_TRUE(forfeited->view.result.has_value());
	EXPECT_EQ(forfeited->view.result->reason, engine::TerminationReason::TimeoutForfeit);
	EXPECT_EQ(forfeited->view.result->winner, rules::Color::Black);

	// The game is over for the remaining player too.
	sendFrom(bob, network::ClientAction{.sessionId = sessionId, .action = ban("e2e4")});
	EXPECT_EQ(nextError(bob), ErrorCode::GameNotActive);

	// Forfeited once: nothing else arrives after another grace window.
	const auto received = m_transport.received(bob);
	std::this_thread::sleep_for(std::chrono::milliseconds(1000));
	EXPECT_EQ(m_transport.received(bob), received);
}

TEST_F(MultiplexerTest, MatchedPlayerWhoNeverAttachesForfeits) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(bob, 1));

	// Alice drops between the match and her attach.
	m_multiplexer->onDisconnect(alice);
	const auto forfeited = m_transport.next<ServerState>(bob, [](const ServerState& s) { return s.view.status == SessionStatus::Finished; });
	ASSERT_TRUE(forfeited);
	ASSERT_TRUE(forfeited->view.result.has_value());
	EXPECT_EQ(forfeited->view.result->reason, engine::TerminationReason::TimeoutForfeit);
	EXPECT_EQ(forfeited->view.result->winner, rules::Color::Black);
	EXPECT_EQ(forfeited->view.history.size(), 0u);
}

TEST_F(MultiplexerTest, UnclaimedSoloGameIsForfeited) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientCreateSolo{});
	const auto created = m_transport.next<network::ServerGameCreated>(alice);
	ASSERT_TRUE(created);
	m_multiplexer->onDisconnect(alice);

	const auto carol = login("carol");
	sendFrom(carol, network::ClientAttach{.sessionId = created->sessionId});
	const auto watched = stateAt(carol, 1);
	ASSERT_TRUE(watched);
	EXPECT_EQ(watched->view.role, Seat::Observer);

	// The color to act loses. A new game starts with black's ban.
	const auto forfeited = m_transport.next<ServerState>(carol, [](const ServerState& s) { return s.view.status == SessionStatus::Finished; });
	ASSERT_TRUE(forfeited);
	ASSERT_TRUE(forfeited->view.result.has_value());
	EXPECT_EQ(forfeited->view.result->reason, engine::TerminationReason::TimeoutForfeit);
	EXPECT_EQ(forfeited->view.result->winner, rules::Color::White);
}

TEST_F(MultiplexerTest, AttachInTimeKeepsTheGameRunning) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	ASSERT_TRUE(stateAt(bob, 1));

	std::this_thread::sleep_for(std::chrono::milliseconds(1000));
	sendFrom(bob, network::ClientAction{.sessionId = sessionId, .action = ban("e2e4")});
	const auto banned = stateAt(alice, 2);
	ASSERT_TRUE(banned);
	EXPECT_EQ(banned->view.version, 2u);
	EXPECT_EQ(banned->view.status, SessionStatus::Active);
}

TEST_F(MultiplexerTest, ReattachKeepsTheSeat) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	ASSERT_TRUE(stateAt(bob, 1));

	m_multiplexer->onDisconnect(alice);
	const auto aliceAgain = login("alice");
	sendFrom(aliceAgain, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(aliceAgain, 1));

	std::this_thread::sleep_for(std::chrono::milliseconds(1000));
	sendFrom(bob, network::ClientAction{.sessionId = sessionId, .action = ban("e2e4")});
	const auto next = stateAt(aliceAgain, 2);
	ASSERT_TRUE(next);
	EXPECT_EQ(next->view.version, 2u);
	EXPECT_EQ(next->view.status, SessionStatus::Active);
}

TEST_F(MultiplexerTest, DisconnectLeavesTheQueue) {
	const auto alice = login("alice");
	sendFrom(alice, network::ClientJoinQueue{});
	ASSERT_TRUE(m_transport.next<network::ServerQueuePosition>(alice));
	m_multiplexer->onDisconnect(alice);

	const auto bob = login("bob");
	sendFrom(bob, network::ClientJoinQueue{});
	const auto position = m_transport.next<network::ServerQueuePosition>(bob);
	ASSERT_TRUE(position);
	EXPECT_EQ(position->position, 1u);
	EXPECT_FALSE(m_matchmaker->isQueued("alice"));
	EXPECT_EQ(m_registry->size(), 0u);
}

class RetiringMultiplexerTest : public MultiplexerTest {
protected:
	RetiringMultiplexerTest() {
		m_retireDelay = std::chrono::milliseconds(200);
	}
};

TEST_F(RetiringMultiplexerTest, RemovedSessionsDetachTheirConnections) {
	const auto alice     = login("alice");
	const auto bob       = login("bob");
	const auto sessionId = match(alice, bob);
	ASSERT_FALSE(sessionId.empty());
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	sendFrom(bob, network::ClientAttach{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(alice, 1));
	ASSERT_TRUE(stateAt(bob, 1));

	sendFrom(alice, network::ClientResign{.sessionId = sessionId});
	ASSERT_TRUE(stateAt(bob, 2));

	for (const auto connectionId: {alice, bob}) {
		const auto detached = m_transport.next<network::ServerDetached>(connectionId);
		ASSERT_TRUE(detached);
		EXPECT_EQ(detached->sessionId, sessionId);
	}
	EXPECT_EQ(m_registry->size(), 0u);

	// Neither the attachment nor the match outlives the session.
	sendFrom(alice, network::ClientAttach{.sessionId = sessionId});
	EXPECT_EQ(nextError(alice), ErrorCode::SessionNotFound);
	sendFrom(bob, network::ClientLeaveQueue{});
	EXPECT_EQ(nextError(bob), ErrorCode::NotQueued);
}

} // namespace banchess::gtest
