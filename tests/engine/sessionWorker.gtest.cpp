#include "engine/sessionWorker.hpp"
#include "rules/banChessRules.hpp"
#include "testUtils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <future>
#include <stdexcept>
#include <thread>

namespace banchess::gtest {

using engine::ErrorCode;
using engine::Seat;
using engine::SessionStatus;

//! Rules that break on every applied action.
class FaultyRules : public rules::IRulesEngine {
public:
	rules::Position initialPosition() const override {
		return m_rules.initialPosition();
	}
	rules::LegalActions legalActions(const rules::Position& pos) const override {
		return m_rules.legalActions(pos);
	}
	std::optional<rules::Position> apply(const rules::Position&, const rules::Action&) const override {
		throw std::runtime_error("corrupt position");
	}
	rules::Outcome outcome(const rules::Position& pos) const override {
		return m_rules.outcome(pos);
	}
	bool inCheck(const rules::Position& pos) const override {
		return m_rules.inCheck(pos);
	}

private:
	rules::BanChessRules m_rules;
};

class SessionWorkerTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_timers.start();
	}
	void TearDown() override {
		if (m_worker) {
			m_worker->stop();
		}
		m_timers.stop();
	}

	void launch(std::optional<engine::TimeControl> timeControl) {
		engine::Session session("w-1", engine::GameMode::Online, participants("alice", "bob"), timeControl, m_rules);
		m_worker = std::make_shared<engine::SessionWorker>(std::move(session), m_timers, &m_observer);
		m_worker->start();
	}

	rules::BanChessRules m_rules;
	engine::TimerService m_timers;
	RecordingObserver m_observer;
	std::shared_ptr<engine::SessionWorker> m_worker;
};

TEST_F(SessionWorkerTest, AppliesCommandsInOrder) {
	launch(std::nullopt);
	EXPECT_EQ(m_worker->state()->status, SessionStatus::Waiting);

	EXPECT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);
	EXPECT_EQ(m_worker->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("e2e4")}, 7).get(), ErrorCode::None);
	EXPECT_EQ(m_worker->post(engine::SubmitCommand{.seat = Seat::White, .action = move("d2d4")}, 8).get(), ErrorCode::None);

	const auto state = m_worker->state();
	EXPECT_EQ(state->status, SessionStatus::Active);
	EXPECT_EQ(state->history.size(), 2u);
	EXPECT_EQ(state->version, 3u);

	// Published in version order, one state per accepted transition.
	ASSERT_TRUE(m_observer.waitForState([](const engine::SessionState& s) { return s.version == 3u; }));
	EXPECT_EQ(m_observer.versions("w-1"), (std::vector<std::uint64_t>{1, 2, 3}));
}

TEST_F(SessionWorkerTest, RejectionsGoBackToTheOrigin) {
	launch(std::nullopt);
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);

	EXPECT_EQ(m_worker->post(engine::SubmitCommand{.seat = Seat::White, .action = ban("e2e4")}, 42).get(), ErrorCode::NotYourTurn);
	EXPECT_EQ(m_worker->post(engine::OfferDrawCommand{.seat = Seat::Observer}).get(), ErrorCode::NotAPlayer);

	ASSERT_TRUE(m_observer.waitForRejections(1));
	const auto rejections = m_observer.rejections();
	ASSERT_EQ(rejections.size(), 1u); // Commands without origin are not reported.
	EXPECT_EQ(std::get<0>(rejections[0]), "w-1");
	EXPECT_EQ(std::get<1>(rejections[0]), 42u);
	EXPECT_EQ(std::get<2>(rejections[0]), ErrorCode::NotYourTurn);

	EXPECT_EQ(m_worker->state()->version, 1u);
}

TEST_F(SessionWorkerTest, ClockExpiryFinishesTheGame) {
	launch(engine::TimeControl{.initialSeconds = 1, .incrementSeconds = 0});
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);

	const auto finished = m_observer.waitForState([](const engine::SessionState& s) { return s.status == SessionStatus::Finished; });
	ASSERT_TRUE(finished);
	ASSERT_TRUE(finished->result.has_value());
	EXPECT_EQ(finished->result->reason, engine::TerminationReason::Timeout);
	EXPECT_EQ(finished->result->winner, rules::Color::White); // Black had to ban first.
	ASSERT_TRUE(finished->clock.has_value());
	EXPECT_EQ(finished->clock->black, std::chrono::milliseconds::zero());
}

TEST_F(SessionWorkerTest, AddedTimeDefersTheFlag) {
	launch(engine::TimeControl{.initialSeconds = 1, .incrementSeconds = 0});
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);
	ASSERT_EQ(m_worker->post(engine::GiveTimeCommand{.seat = Seat::White, .seconds = 60}).get(), ErrorCode::None);

	std::this_thread::sleep_for(std::chrono::milliseconds(1500));
	EXPECT_EQ(m_worker->state()->status, SessionStatus::Active);
	EXPECT_EQ(m_worker->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("e2e4")}).get(), ErrorCode::None);
}

TEST_F(SessionWorkerTest, ConcurrentSubmissionsAcceptOne) {
	launch(std::nullopt);
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);

	// Both try to act for black at the same time.
	std::future<ErrorCode> first;
	std::future<ErrorCode> second;
	{
		std::jthread a([&] { first = m_worker->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("e2e4")}, 1); });
		std::jthread b([&] { second = m_worker->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("d2d4")}, 2); });
	}
	const auto results = std::array{first.get(), second.get()};

	EXPECT_EQ(std::ranges::count(results, ErrorCode::None), 1);
	EXPECT_EQ(std::ranges::count(results, ErrorCode::NotYourTurn), 1);
	EXPECT_EQ(m_worker->state()->history.size(), 1u);
	EXPECT_EQ(m_worker->state()->version, 2u);
}

TEST_F(SessionWorkerTest, FaultEndsOnlyThatSession) {
	launch(std::nullopt);
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);

	FaultyRules faulty;
	engine::Session session("w-2", engine::GameMode::Online, participants("carol", "dave"), std::nullopt, faulty);
	auto broken = std::make_shared<engine::SessionWorker>(std::move(session), m_timers, &m_observer);
	broken->start();
	ASSERT_EQ(broken->post(engine::StartCommand{}).get(), ErrorCode::None);

	EXPECT_EQ(broken->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("e2e4")}, 9).get(), ErrorCode::InternalError);
	const auto failed = broken->state();
	EXPECT_EQ(failed->status, SessionStatus::Finished);
	ASSERT_TRUE(failed->result.has_value());
	EXPECT_EQ(failed->result->reason, engine::TerminationReason::Error);
	EXPECT_FALSE(failed->result->winner.has_value());
	ASSERT_TRUE(m_observer.waitForRejections(1));
	EXPECT_EQ(std::get<2>(m_observer.rejections()[0]), ErrorCode::InternalError);
	broken->stop();

	// The other session keeps going.
	EXPECT_EQ(m_worker->post(engine::SubmitCommand{.seat = Seat::Black, .action = ban("e2e4")}).get(), ErrorCode::None);
	EXPECT_EQ(m_worker->state()->status, SessionStatus::Active);
}

TEST_F(SessionWorkerTest, StoppedWorkerRejectsCommands) {
	launch(std::nullopt);
	ASSERT_EQ(m_worker->post(engine::StartCommand{}).get(), ErrorCode::None);

	m_worker->stop();
	m_worker->stop();
	EXPECT_EQ(m_worker->post(engine::ResignCommand{.seat = Seat::White}).get(), ErrorCode::GameNotActive);
	EXPECT_EQ(m_worker->state()->status, SessionStatus::Active);
}

} // namespace banchess::gtest
