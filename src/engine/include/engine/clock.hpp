#pragma once

#include "engine/types.hpp"

#include <chrono>

namespace banchess::engine {

//! Fischer clock: main time plus an increment credited when the turn passes to the other color.
//! Absolute clock when the increment is zero.
//! \note A turn is a move plus the ban that follows it, so the clock only switches when the acting color changes.
class GameClock {
public:
	using Duration  = std::chrono::milliseconds;
	using TimePoint = std::chrono::steady_clock::time_point;

	enum class State { Stopped, Running };

	struct Snapshot {
		State state;
		rules::Color running;
		Duration white;
		Duration black;
	};

public:
	explicit GameClock(const TimeControl& timeControl);

	void start(rules::Color toAct, TimePoint now); //!< Start running for the color that acts first.
	void push(rules::Color nextActor, TimePoint now); //!< An action was accepted. Switch if the acting color changes.
	void stop(TimePoint now);

	void addTime(rules::Color color, Duration delta); //!< Credit extra time to a color.

	Duration remaining(rules::Color color, TimePoint now) const;
	bool flagged(TimePoint now) const; //!< The running color has no time left.

	bool isRunning() const;
	rules::Color running() const;
	Snapshot snapshot(TimePoint now) const;

private:
	void updateElapsed(TimePoint now);
	Duration& mainRemainingRef(rules::Color color);

private:
	Duration m_white;
	Duration m_black;
	Duration m_increment;

	State m_state{State::Stopped};
	rules::Color m_running{rules::Color::Black};
	TimePoint m_lastTick{};
};

} // namespace banchess::engine
