#pragma once

#include "rules/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace banchess::engine {

using SessionId = std::string;   //!< "<salt>-<sequence>", unique for the process lifetime.
using UserId    = std::string;   //!< Authenticated user identifier.
using OriginId  = std::uint32_t; //!< Connection that caused a command. Transport connection ids start at 1.

inline constexpr OriginId NO_ORIGIN = 0; //!< Command injected by a timer or the server itself.

using SystemTime = std::chrono::system_clock::time_point; //!< Server timestamps.

struct Identity {
	UserId userId;
	std::string displayName;

	bool operator==(const Identity&) const = default;
};

//! The role of a connection in a session.
//! \note Solo sessions bind both colors to one identity, its seat is Black | White.
enum class Seat : std::uint8_t {
	None     = 0,      //!< Not attached.
	Black    = 1 << 1, //!< Plays for black.
	White    = 1 << 2, //!< Plays for white.
	Observer = 1 << 3  //!< Spectator. Only gets state updates.
};

inline constexpr Seat operator|(Seat lhs, Seat rhs) {
	return static_cast<Seat>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}
inline constexpr Seat operator&(Seat lhs, Seat rhs) {
	return static_cast<Seat>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

inline constexpr Seat seatFor(rules::Color color) {
	return color == rules::Color::White ? Seat::White : Seat::Black;
}
inline constexpr bool hasColor(Seat seat, rules::Color color) {
	return (seat & seatFor(color)) != Seat::None;
}
inline constexpr bool isPlayer(Seat seat) {
	return (seat & (Seat::Black | Seat::White)) != Seat::None;
}

enum class GameMode : std::uint8_t { Solo, Online };

//! Status only moves forward: Waiting -> Active -> Finished.
enum class SessionStatus : std::uint8_t { Waiting, Active, Finished };

enum class TerminationReason : std::uint8_t {
	Checkmate,
	Stalemate,
	Resignation,
	Timeout,        //!< Clock flag.
	TimeoutForfeit, //!< Player seat stayed empty longer than the grace window.
	DrawAgreement,
	InsufficientMaterial,
	FiftyMoveRule,
	Error, //!< Internal fault of the session worker.
};

struct GameResult {
	std::optional<rules::Color> winner; //!< Empty for draws and errors.
	TerminationReason reason{TerminationReason::Error};

	bool operator==(const GameResult&) const = default;
};

struct TimeControl {
	unsigned initialSeconds{300};
	unsigned incrementSeconds{0};

	bool operator==(const TimeControl&) const = default;
};

inline constexpr unsigned MAX_INITIAL_SECONDS   = 3 * 60 * 60;
inline constexpr unsigned MAX_INCREMENT_SECONDS = 180;
inline constexpr unsigned MAX_GIVE_TIME_SECONDS = 300; //!< Upper bound of one give time request.

//! Initial time in [1, MAX_INITIAL_SECONDS], increment at most MAX_INCREMENT_SECONDS.
bool isValid(const TimeControl& timeControl);

//! Preference class of a time control. "<initial>+<increment>" or "untimed".
std::string timeControlKey(const std::optional<TimeControl>& timeControl);

//! One applied ban or move. Never modified after it was appended.
struct HistoryEntry {
	unsigned ply{0};        //!< 1-based index in the history.
	rules::Color color{};   //!< Color that acted.
	rules::Action action{}; //!< Ban or move payload.
	SystemTime timestamp{}; //!< Server time of acceptance.
	std::string fenAfter;   //!< Position after the action.

	bool operator==(const HistoryEntry&) const = default;
};

enum class ErrorCode : std::uint8_t {
	None = 0,
	MalformedMessage,
	NotAuthenticated,
	AlreadyAuthenticated,
	AuthFailed,
	SessionNotFound,
	SessionFinished,
	SeatOccupied,
	AlreadyAttached,
	NotAttached,
	NotAPlayer,
	GameNotActive,
	NotYourTurn,
	WrongPhase,
	IllegalAction,
	AlreadyQueued,
	NotQueued,
	AlreadyMatched,
	NoTimeControl,
	NotAllowedInSolo,
	NoDrawOffer,
	InternalError,
	Count //!< Used in serialisation to check when enum changes.
};

std::string toString(ErrorCode code);                      //!< Kebab-case wire name.
std::optional<ErrorCode> errorFromString(std::string_view s); //!< Inverse of toString(ErrorCode).
std::string errorMessage(ErrorCode code);                  //!< Human readable description.

std::string toString(GameMode mode);
std::optional<GameMode> gameModeFromString(std::string_view s);
std::string toString(SessionStatus status);
std::optional<SessionStatus> sessionStatusFromString(std::string_view s);
std::string toString(TerminationReason reason);
std::optional<TerminationReason> terminationReasonFromString(std::string_view s);

} // namespace banchess::engine
