#include "engine/clock.hpp"

#include <gtest/gtest.h>

namespace banchess::gtest {

using namespace std::chrono_literals;
using engine::GameClock;
using rules::Color;

class GameClockTest : public ::testing::Test {
protected:
	GameClock::TimePoint t0 = GameClock::TimePoint{} + 1h;
};

TEST_F(GameClockTest, RunsForTheActingColor) {
	GameClock clock(engine::TimeControl{.initialSeconds = 60, .incrementSeconds = 0});
	EXPECT_FALSE(clock.isRunning());
	EXPECT_EQ(clock.remaining(Color::White, t0 + 10s), 60s);

	clock.start(Color::Black, t0);
	EXPECT_TRUE(clock.isRunning());
	EXPECT_EQ(clock.running(), Color::Black);
	EXPECT_EQ(clock.remaining(Color::Black, t0 + 10s), 50s);
	EXPECT_EQ(clock.remaining(Color::White, t0 + 10s), 60s);
}

TEST_F(GameClockTest, IncrementOnlyWhenTheTurnPasses) {
	GameClock clock(engine::TimeControl{.initialSeconds = 60, .incrementSeconds = 2});
	clock.start(Color::Black, t0);

	clock.push(Color::White, t0 + 5s); // Black banned.
	EXPECT_EQ(clock.remaining(Color::Black, t0 + 5s), 57s);
	EXPECT_EQ(clock.running(), Color::White);

	clock.push(Color::White, t0 + 8s); // White moved, White bans next.
	EXPECT_EQ(clock.running(), Color::White);
	EXPECT_EQ(clock.remaining(Color::White, t0 + 8s), 57s);

	clock.push(Color::Black, t0 + 10s); // White banned.
	EXPECT_EQ(clock.remaining(Color::White, t0 + 10s), 57s);
	EXPECT_EQ(clock.running(), Color::Black);
}

TEST_F(GameClockTest, FlagsAtZero) {
	GameClock clock(engine::TimeControl{.initialSeconds = 3, .incrementSeconds = 5});
	clock.start(Color::Black, t0);

	EXPECT_FALSE(clock.flagged(t0 + 2999ms));
	EXPECT_TRUE(clock.flagged(t0 + 3s));
	EXPECT_EQ(clock.remaining(Color::Black, t0 + 10s), 0ms);

	// No increment for a flagged color.
	clock.push(Color::White, t0 + 4s);
	EXPECT_EQ(clock.remaining(Color::Black, t0 + 4s), 0ms);
}

TEST_F(GameClockTest, StopFreezesAndAddTimeCredits) {
	GameClock clock(engine::TimeControl{.initialSeconds = 30, .incrementSeconds = 0});
	clock.start(Color::White, t0);
	clock.addTime(Color::White, 15s);
	clock.addTime(Color::Black, -5s); // Ignored.
	EXPECT_EQ(clock.remaining(Color::White, t0), 45s);
	EXPECT_EQ(clock.remaining(Color::Black, t0), 30s);

	clock.stop(t0 + 5s);
	EXPECT_FALSE(clock.isRunning());
	EXPECT_FALSE(clock.flagged(t0 + 1h));

	const auto snap = clock.snapshot(t0 + 1h);
	EXPECT_EQ(snap.state, GameClock::State::Stopped);
	EXPECT_EQ(snap.white, 40s);
	EXPECT_EQ(snap.black, 30s);
}

} // namespace banchess::gtest
