#include "engine/types.hpp"

#include <array>
#include <format>
#include <initializer_list>

namespace banchess::engine {

struct ErrorInfo {
	std::string_view name;
	std::string_view message;
};

static constexpr std::array<ErrorInfo, static_cast<std::size_t>(ErrorCode::Count)> ERROR_INFO{{
        {"none", "Success."},
        {"malformed-message", "Message could not be parsed."},
        {"not-authenticated", "Authenticate before sending other messages."},
        {"already-authenticated", "Connection is already authenticated."},
        {"auth-failed", "Invalid credentials."},
        {"session-not-found", "No session with this id."},
        {"session-finished", "Session is already finished."},
        {"seat-occupied", "Seat is held by another connection."},
        {"already-attached", "Detach from the current session first."},
        {"not-attached", "Connection is not attached to this session."},
        {"not-a-player", "Only players can do this."},
        {"game-not-active", "Game is not active."},
        {"not-your-turn", "It is not your turn."},
        {"wrong-phase", "This action kind is not expected now."},
        {"illegal-action", "Action is not legal in this position."},
        {"already-queued", "Already waiting in the queue."},
        {"not-queued", "Not waiting in the queue."},
        {"already-matched", "Queue entry was already matched."},
        {"no-time-control", "Game has no time control."},
        {"not-allowed-in-solo", "Not available in solo games."},
        {"no-draw-offer", "There is no draw offer to accept."},
        {"internal-error", "Internal server error."},
}};

bool isValid(const TimeControl& timeControl) {
	return timeControl.initialSeconds > 0 && timeControl.initialSeconds <= MAX_INITIAL_SECONDS && timeControl.incrementSeconds <= MAX_INCREMENT_SECONDS;
}

std::string timeControlKey(const std::optional<TimeControl>& timeControl) {
	if (!timeControl) {
		return "untimed";
	}
	return std::format("{}+{}", timeControl->initialSeconds, timeControl->incrementSeconds);
}

std::string toString(ErrorCode code) {
	const auto index = static_cast<std::size_t>(code);
	if (index >= ERROR_INFO.size()) {
		return "internal-error";
	}
	return std::string{ERROR_INFO[index].name};
}

std::optional<ErrorCode> errorFromString(std::string_view s) {
	for (std::size_t i = 0; i < ERROR_INFO.size(); ++i) {
		if (ERROR_INFO[i].name == s) {
			return static_cast<ErrorCode>(i);
		}
	}
	return {};
}

std::string errorMessage(ErrorCode code) {
	const auto index = static_cast<std::size_t>(code);
	if (index >= ERROR_INFO.size()) {
		return "Unknown error.";
	}
	return std::string{ERROR_INFO[index].message};
}

std::string toString(GameMode mode) {
	return mode == GameMode::Solo ? "solo" : "online";
}

std::optional<GameMode> gameModeFromString(std::string_view s) {
	if (s == "solo") {
		return GameMode::Solo;
	}
	if (s == "online") {
		return GameMode::Online;
	}
	return {};
}

std::string toString(SessionStatus status) {
	switch (status) {
	case SessionStatus::Waiting:
		return "waiting";
	case SessionStatus::Active:
		return "active";
	case SessionStatus::Finished:
		return "finished";
	}
	return "finished";
}

std::optional<SessionStatus> sessionStatusFromString(std::string_view s) {
	for (const auto status: {SessionStatus::Waiting, SessionStatus::Active, SessionStatus::Finished}) {
		if (toString(status) == s) {
			return status;
		}
	}
	return {};
}

std::string toString(TerminationReason reason) {
	switch (reason) {
	case TerminationReason::Checkmate:
		return "checkmate";
	case TerminationReason::Stalemate:
		return "stalemate";
	case TerminationReason::Resignation:
		return "resignation";
	case TerminationReason::Timeout:
		return "timeout";
	case TerminationReason::TimeoutForfeit:
		return "timeout-forfeit";
	case TerminationReason::DrawAgreement:
		return "draw-agreement";
	case TerminationReason::InsufficientMaterial:
		return "insufficient-material";
	case TerminationReason::FiftyMoveRule:
		return "fifty-move-rule";
	case TerminationReason::Error:
		return "error";
	}
	return "error";
}

std::optional<TerminationReason> terminationReasonFromString(std::string_view s) {
	for (const auto reason: {TerminationReason::Checkmate, TerminationReason::Stalemate, TerminationReason::Resignation, TerminationReason::Timeout,
	                         TerminationReason::TimeoutForfeit, TerminationReason::DrawAgreement, TerminationReason::InsufficientMaterial,
	                         TerminationReason::FiftyMoveRule, TerminationReason::Error}) {
		if (toString(reason) == s) {
			return reason;
		}
	}
	return {};
}

} // namespace banchess::engine
