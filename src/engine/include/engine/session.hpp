#pragma once

#include "engine/clock.hpp"
#include "engine/types.hpp"
#include "rules/position.hpp"
#include "rules/rulesEngine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace banchess::engine {

struct Participants {
	Identity white;
	Identity black;

	//! Seat of a user in this game. Black | White for solo games, Observer for everyone else.
	Seat seatOf(const UserId& userId) const;
	bool contains(const UserId& userId) const;
	const Identity& of(rules::Color color) const;
};

struct ClockState {
	std::chrono::milliseconds white;
	std::chrono::milliseconds black;
	std::optional<rules::Color> running; //!< Empty while the clock is stopped.

	bool operator==(const ClockState&) const = default;
};

//! Immutable copy of a session, published after every accepted transition.
struct SessionState {
	SessionId id;
	GameMode mode{GameMode::Online};
	Participants participants;
	std::optional<TimeControl> timeControl;

	rules::Position position;
	std::vector<HistoryEntry> history;
	SessionStatus status{SessionStatus::Waiting};
	std::optional<GameResult> result; //!< Set iff status is Finished.

	rules::LegalActions legal; //!< Pending action kind, actor and the complete legal set.
	bool inCheck{false};       //!< Side to move is in check.

	std::optional<ClockState> clock; //!< Set for timed games.
	std::optional<rules::Color> drawOfferedBy;

	std::uint64_t version{0}; //!< Bumped on every accepted transition.

	SystemTime createdAt{};
	std::optional<SystemTime> startedAt;
	std::optional<SystemTime> finishedAt;
};

//! Turn state machine of one game: ban -> move -> ban -> move ... until a terminal condition.
//! \note Not thread safe. A SessionWorker serialises all calls.
class Session {
public:
	using TimePoint = GameClock::TimePoint;

	Session(SessionId id, GameMode mode, Participants participants, std::optional<TimeControl> timeControl, const rules::IRulesEngine& rules);

	ErrorCode start(TimePoint now); //!< Waiting -> Active. Starts the clock for the first actor.

	//! Validate and apply a ban or move for the given seat.
	//! Rejections leave the session unchanged. Order: game-not-active, not-a-player, not-your-turn, wrong-phase, illegal-action.
	ErrorCode submit(Seat seat, const rules::Action& action, TimePoint now);

	ErrorCode resign(Seat seat, TimePoint now);
	ErrorCode offerDraw(Seat seat);
	ErrorCode acceptDraw(Seat seat, TimePoint now);
	ErrorCode giveTime(Seat seat, unsigned seconds, TimePoint now);

	bool checkClock(TimePoint now);                   //!< Finish as timeout when the running color flagged. Returns true if finished.
	ErrorCode forfeit(rules::Color loser, TimePoint now); //!< Grace window expired for the loser's seat.
	bool fail(TimePoint now);                         //!< Finish as error. No-op if already finished.

	//! Re-apply a persisted history entry without clock handling. Keeps the original timestamp.
	ErrorCode restore(const HistoryEntry& entry);

	//! Remaining time until the running color flags. Empty for untimed or inactive games.
	std::optional<GameClock::Duration> timeUntilFlag(TimePoint now) const;

	const SessionState& state() const;
	std::shared_ptr<const SessionState> publish(TimePoint now) const; //!< Copy with the current clock values.

private:
	//! Acting color the seat plays now. Empty if the seat does not hold the acting color.
	std::optional<rules::Color> colorToAct(Seat seat) const;
	//! The color a seat represents for resign, draw and give time.
	rules::Color seatColor(Seat seat) const;

	void appendAndAdvance(const rules::Action& action, rules::Position next, SystemTime timestamp);
	void finish(std::optional<rules::Color> winner, TerminationReason reason, TimePoint now);
	void finishOnOutcome(TimePoint now);
	void refreshDerived();

private:
	const rules::IRulesEngine& m_rules;
	SessionState m_state;
	std::optional<GameClock> m_clock;
};

//! Fold a history through the rules from the initial position. Empty if any action is rejected.
std::optional<rules::Position> replay(const rules::IRulesEngine& rules, const std::vector<HistoryEntry>& history);

} // namespace banchess::engine
