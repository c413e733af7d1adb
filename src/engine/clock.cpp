#include "engine/clock.hpp"

#include <algorithm>

namespace banchess::engine {

GameClock::GameClock(const TimeControl& timeControl)
    : m_white(std::chrono::seconds(timeControl.initialSeconds)), m_black(std::chrono::seconds(timeControl.initialSeconds)),
      m_increment(std::chrono::seconds(timeControl.incrementSeconds)) {
}

void GameClock::start(rules::Color toAct, TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
	}
	m_running  = toAct;
	m_lastTick = now;
	m_state    = State::Running;
}

void GameClock::push(rules::Color nextActor, TimePoint now) {
	if (m_state != State::Running) {
		return;
	}

	updateElapsed(now);
	if (nextActor != m_running) {
		if (mainRemainingRef(m_running) > Duration::zero()) {
			mainRemainingRef(m_running) += m_increment;
		}
		m_running = nextActor;
	}
	m_lastTick = now;
}

void GameClock::stop(TimePoint now) {
	if (m_state == State::Running) {
		updateElapsed(now);
	}
	m_state = State::Stopped;
}

void GameClock::addTime(rules::Color color, Duration delta) {
	if (delta <= Duration::zero()) {
		return;
	}
	mainRemainingRef(color) += delta;
}

GameClock::Duration GameClock::remaining(rules::Color color, TimePoint now) const {
	const auto snap = snapshot(now);
	return color == rules::Color::White ? snap.white : snap.black;
}

bool GameClock::flagged(TimePoint now) const {
	return m_state == State::Running && remaining(m_running, now) <= Duration::zero();
}

bool GameClock::isRunning() const {
	return m_state == State::Running;
}

rules::Color GameClock::running() const {
	return m_running;
}

GameClock::Snapshot GameClock::snapshot(TimePoint now) const {
	auto white = m_white;
	auto black = m_black;

	if (m_state == State::Running) {
		const auto elapsed = std::chrono::duration_cast<Duration>(now - m_lastTick);
		if (elapsed > Duration::zero()) {
			auto& remaining = m_running == rules::Color::White ? white : black;
			remaining       = std::max(remaining - elapsed, Duration::zero());
		}
	}

	return {m_state, m_running, white, black};
}

void GameClock::updateElapsed(TimePoint now) {
	const auto elapsed = std::chrono::duration_cast<Duration>(now - m_lastTick);
	if (elapsed <= Duration::zero()) {
		m_lastTick = now;
		return;
	}

	auto& remaining = mainRemainingRef(m_running);
	remaining       = std::max(remaining - elapsed, Duration::zero());
	m_lastTick      = now;
}

GameClock::Duration& GameClock::mainRemainingRef(rules::Color color) {
	return color == rules::Color::White ? m_white : m_black;
}

} // namespace banchess::engine
