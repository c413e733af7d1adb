#include "engine/session.hpp"

#include <utility>

namespace banchess::engine {

Seat Participants::seatOf(const UserId& userId) const {
	Seat seat = Seat::None;
	if (white.userId == userId) {
		seat = seat | Seat::White;
	}
	if (black.userId == userId) {
		seat = seat | Seat::Black;
	}
	return seat == Seat::None ? Seat::Observer : seat;
}

bool Participants::contains(const UserId& userId) const {
	return white.userId == userId || black.userId == userId;
}

const Identity& Participants::of(rules::Color color) const {
	return color == rules::Color::White ? white : black;
}


Session::Session(SessionId id, GameMode mode, Participants participants, std::optional<TimeControl> timeControl, const rules::IRulesEngine& rules)
    : m_rules(rules) {
	m_state.id           = std::move(id);
	m_state.mode         = mode;
	m_state.participants = std::move(participants);
	m_state.timeControl  = timeControl;
	m_state.position     = m_rules.initialPosition();
	m_state.status       = SessionStatus::Waiting;
	m_state.createdAt    = std::chrono::system_clock::now();

	if (timeControl) {
		m_clock.emplace(*timeControl);
	}
	refreshDerived();
}

ErrorCode Session::start(TimePoint now) {
	if (m_state.status != SessionStatus::Waiting) {
		return ErrorCode::GameNotActive;
	}

	m_state.status    = SessionStatus::Active;
	m_state.startedAt = std::chrono::system_clock::now();
	if (m_clock) {
		m_clock->start(m_state.legal.actor, now);
	}
	// A restored history can already end in a terminal position.
	finishOnOutcome(now);
	++m_state.version;
	return ErrorCode::None;
}

ErrorCode Session::submit(Seat seat, const rules::Action& action, TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}
	if (!isPlayer(seat)) {
		return ErrorCode::NotAPlayer;
	}
	if (!colorToAct(seat)) {
		return ErrorCode::NotYourTurn;
	}
	if (action.type != m_state.position.pending) {
		return ErrorCode::WrongPhase;
	}

	// The action arrived after the flag fell but before the expiry timer fired.
	if (checkClock(now)) {
		return ErrorCode::GameNotActive;
	}

	auto next = m_rules.apply(m_state.position, action);
	if (!next) {
		return ErrorCode::IllegalAction;
	}

	appendAndAdvance(action, std::move(*next), std::chrono::system_clock::now());
	m_state.drawOfferedBy.reset();
	if (m_clock) {
		m_clock->push(m_state.legal.actor, now);
	}
	finishOnOutcome(now);

	++m_state.version;
	return ErrorCode::None;
}

ErrorCode Session::resign(Seat seat, TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}
	if (!isPlayer(seat)) {
		return ErrorCode::NotAPlayer;
	}

	finish(rules::opponent(seatColor(seat)), TerminationReason::Resignation, now);
	++m_state.version;
	return ErrorCode::None;
}

ErrorCode Session::offerDraw(Seat seat) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}
	if (!isPlayer(seat)) {
		return ErrorCode::NotAPlayer;
	}
	if (m_state.mode == GameMode::Solo) {
		return ErrorCode::NotAllowedInSolo;
	}

	m_state.drawOfferedBy = seatColor(seat);
	++m_state.version;
	return ErrorCode::None;
}

ErrorCode Session::acceptDraw(Seat seat, TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}
	if (!isPlayer(seat)) {
		return ErrorCode::NotAPlayer;
	}
	if (m_state.mode == GameMode::Solo) {
		return ErrorCode::NotAllowedInSolo;
	}
	if (!m_state.drawOfferedBy || *m_state.drawOfferedBy == seatColor(seat)) {
		return ErrorCode::NoDrawOffer;
	}

	finish(std::nullopt, TerminationReason::DrawAgreement, now);
	++m_state.version;
	return ErrorCode::None;
}

ErrorCode Session::giveTime(Seat seat, unsigned seconds, TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}
	if (!isPlayer(seat)) {
		return ErrorCode::NotAPlayer;
	}
	if (m_state.mode == GameMode::Solo) {
		return ErrorCode::NotAllowedInSolo;
	}
	if (!m_clock) {
		return ErrorCode::NoTimeControl;
	}
	if (checkClock(now)) {
		return ErrorCode::GameNotActive;
	}

	m_clock->addTime(rules::opponent(seatColor(seat)), std::chrono::seconds(seconds));
	++m_state.version;
	return ErrorCode::None;
}

bool Session::checkClock(TimePoint now) {
	if (m_state.status != SessionStatus::Active || !m_clock || !m_clock->flagged(now)) {
		return false;
	}

	finish(rules::opponent(m_clock->running()), TerminationReason::Timeout, now);
	++m_state.version;
	return true;
}

ErrorCode Session::forfeit(rules::Color loser, TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return ErrorCode::GameNotActive;
	}

	finish(rules::opponent(loser), TerminationReason::TimeoutForfeit, now);
	++m_state.version;
	return ErrorCode::None;
}

bool Session::fail(TimePoint now) {
	if (m_state.status == SessionStatus::Finished) {
		return false;
	}

	finish(std::nullopt, TerminationReason::Error, now);
	++m_state.version;
	return true;
}

ErrorCode Session::restore(const HistoryEntry& entry) {
	if (m_state.status != SessionStatus::Waiting) {
		return ErrorCode::GameNotActive;
	}
	if (entry.color != m_state.legal.actor) {
		return ErrorCode::NotYourTurn;
	}
	if (entry.action.type != m_state.position.pending) {
		return ErrorCode::WrongPhase;
	}

	auto next = m_rules.apply(m_state.position, entry.action);
	if (!next) {
		return ErrorCode::IllegalAction;
	}

	appendAndAdvance(entry.action, std::move(*next), entry.timestamp);
	return ErrorCode::None;
}

std::optional<GameClock::Duration> Session::timeUntilFlag(TimePoint now) const {
	if (m_state.status != SessionStatus::Active || !m_clock || !m_clock->isRunning()) {
		return {};
	}
	return m_clock->remaining(m_clock->running(), now);
}

const SessionState& Session::state() const {
	return m_state;
}

std::shared_ptr<const SessionState> Session::publish(TimePoint now) const {
	auto copy = m_state;
	if (m_clock) {
		const auto snap = m_clock->snapshot(now);
		std::optional<rules::Color> running;
		if (snap.state == GameClock::State::Running) {
			running = snap.running;
		}
		copy.clock = ClockState{.white = snap.white, .black = snap.black, .running = running};
	}
	return std::make_shared<const SessionState>(std::move(copy));
}

std::optional<rules::Color> Session::colorToAct(Seat seat) const {
	const auto actor = m_state.legal.actor;
	if (!hasColor(seat, actor)) {
		return {};
	}
	return actor;
}

rules::Color Session::seatColor(Seat seat) const {
	// Solo seats hold both colors: they act for whoever is to act.
	if (hasColor(seat, rules::Color::White) && hasColor(seat, rules::Color::Black)) {
		return m_state.legal.actor;
	}
	return hasColor(seat, rules::Color::White) ? rules::Color::White : rules::Color::Black;
}

void Session::appendAndAdvance(const rules::Action& action, rules::Position next, SystemTime timestamp) {
	const auto actor = m_state.legal.actor;

	m_state.position = std::move(next);
	m_state.history.push_back(HistoryEntry{
	        .ply       = static_cast<unsigned>(m_state.history.size() + 1),
	        .color     = actor,
	        .action    = action,
	        .timestamp = timestamp,
	        .fenAfter  = m_state.position.toFen(),
	});
	refreshDerived();
}

void Session::finish(std::optional<rules::Color> winner, TerminationReason reason, TimePoint now) {
	if (m_clock) {
		m_clock->stop(now);
	}
	m_state.status     = SessionStatus::Finished;
	m_state.result     = GameResult{.winner = winner, .reason = reason};
	m_state.finishedAt = std::chrono::system_clock::now();
	m_state.drawOfferedBy.reset();
	m_state.legal.actions.clear();
}

void Session::finishOnOutcome(TimePoint now) {
	if (m_state.status != SessionStatus::Active) {
		return;
	}

	switch (m_rules.outcome(m_state.position)) {
	case rules::Outcome::Ongoing:
		break;
	case rules::Outcome::Checkmate:
		finish(rules::opponent(m_state.position.sideToMove), TerminationReason::Checkmate, now);
		break;
	case rules::Outcome::Stalemate:
		finish(std::nullopt, TerminationReason::Stalemate, now);
		break;
	case rules::Outcome::InsufficientMaterial:
		finish(std::nullopt, TerminationReason::InsufficientMaterial, now);
		break;
	case rules::Outcome::FiftyMoveRule:
		finish(std::nullopt, TerminationReason::FiftyMoveRule, now);
		break;
	}
}

void Session::refreshDerived() {
	m_state.legal   = m_rules.legalActions(m_state.position);
	m_state.inCheck = m_rules.inCheck(m_state.position);
}


std::optional<rules::Position> replay(const rules::IRulesEngine& rules, const std::vector<HistoryEntry>& history) {
	auto position = rules.initialPosition();
	for (const auto& entry: history) {
		auto next = rules.apply(position, entry.action);
		if (!next) {
			return {};
		}
		position = std::move(*next);
	}
	return position;
}

} // namespace banchess::engine
