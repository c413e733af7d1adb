#include "network/nwEvents.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>

namespace banchess::network {

using nlohmann::json;

static constexpr std::string_view CLIENT_AUTHENTICATE = "authenticate";
static constexpr std::string_view CLIENT_CREATE_SOLO  = "create-solo-game";
static constexpr std::string_view CLIENT_JOIN_QUEUE   = "join-queue";
static constexpr std::string_view CLIENT_LEAVE_QUEUE  = "leave-queue";
static constexpr std::string_view CLIENT_ATTACH       = "attach";
static constexpr std::string_view CLIENT_DETACH       = "detach";
static constexpr std::string_view CLIENT_ACTION       = "action";
static constexpr std::string_view CLIENT_RESIGN       = "resign";
static constexpr std::string_view CLIENT_OFFER_DRAW   = "offer-draw";
static constexpr std::string_view CLIENT_ACCEPT_DRAW  = "accept-draw";
static constexpr std::string_view CLIENT_GIVE_TIME    = "give-time";
static constexpr std::string_view CLIENT_PING         = "ping";

static constexpr std::string_view SERVER_AUTHENTICATED  = "authenticated";
static constexpr std::string_view SERVER_GAME_CREATED   = "game-created";
static constexpr std::string_view SERVER_QUEUE_POSITION = "queue-position";
static constexpr std::string_view SERVER_MATCHED        = "matched";
static constexpr std::string_view SERVER_QUEUE_LEFT     = "queue-left";
static constexpr std::string_view SERVER_DETACHED       = "detached";
static constexpr std::string_view SERVER_STATE          = "state";
static constexpr std::string_view SERVER_ERROR          = "error";
static constexpr std::string_view SERVER_PONG           = "pong";

static json typed(std::string_view type) {
	return json{{"type", std::string(type)}};
}

// Shared field codecs

static json identityToJson(const engine::Identity& identity) {
	return {{"userId", identity.userId}, {"username", identity.displayName}};
}

static engine::Identity identityFromJson(const json& value) {
	return engine::Identity{.userId = value.at("userId").get<std::string>(), .displayName = value.at("username").get<std::string>()};
}

static json timeControlToJson(const std::optional<engine::TimeControl>& timeControl) {
	if (!timeControl) {
		return nullptr;
	}
	return {{"initial", timeControl->initialSeconds}, {"increment", timeControl->incrementSeconds}};
}

//! Whole seconds in [minimum, maximum]. Throws on negative, fractional or out of range values.
static unsigned secondsFromJson(const json& value, unsigned minimum, unsigned maximum) {
	if (!value.is_number_unsigned()) {
		throw std::invalid_argument("seconds must be a non-negative integer");
	}
	const auto seconds = value.get<std::uint64_t>();
	if (seconds < minimum || seconds > maximum) {
		throw std::out_of_range(std::format("seconds must be in [{}, {}]", minimum, maximum));
	}
	return static_cast<unsigned>(seconds);
}

static std::optional<engine::TimeControl> timeControlFromJson(const json& value) {
	if (value.is_null()) {
		return {};
	}
	return engine::TimeControl{
	        .initialSeconds   = secondsFromJson(value.at("initial"), 1, engine::MAX_INITIAL_SECONDS),
	        .incrementSeconds = value.contains("increment") ? secondsFromJson(value.at("increment"), 0, engine::MAX_INCREMENT_SECONDS) : 0u,
	};
}

static void writeRequest(json& target, const TimeControlRequest& request) {
	if (request) {
		target["timeControl"] = timeControlToJson(*request);
	}
}

static TimeControlRequest readRequest(const json& source) {
	TimeControlRequest request;
	if (source.contains("timeControl")) {
		request.emplace(timeControlFromJson(source.at("timeControl")));
	}
	return request;
}

static json colorToJson(const std::optional<rules::Color>& color) {
	return color ? json(rules::toString(*color)) : json(nullptr);
}

//! Throws for unknown colors so the caller rejects the message.
static rules::Color colorFromJson(const json& value) {
	const auto text  = value.get<std::string>();
	const auto color = rules::colorFromString(text);
	if (!color) {
		throw std::invalid_argument(std::format("Unknown color '{}'.", text));
	}
	return *color;
}

static std::optional<rules::Color> optionalColorFromJson(const json& value) {
	if (value.is_null()) {
		return {};
	}
	return colorFromJson(value);
}

static char promotionChar(rules::PieceType type) {
	switch (type) {
	case rules::PieceType::Knight:
		return 'n';
	case rules::PieceType::Bishop:
		return 'b';
	case rules::PieceType::Rook:
		return 'r';
	case rules::PieceType::Queen:
		return 'q';
	default:
		return '\0';
	}
}

static json actionToJson(const rules::Action& action) {
	json payload{{"from", rules::squareName(action.move.from)}, {"to", rules::squareName(action.move.to)}};
	if (action.type == rules::ActionType::Ban) {
		return {{"ban", payload}};
	}
	if (const auto c = promotionChar(action.move.promotion); c != '\0') {
		payload["promotion"] = std::string(1, c);
	}
	return {{"move", payload}};
}

static std::optional<rules::Action> actionFromJson(const json& value) {
	const bool isBan  = value.contains("ban");
	const bool isMove = value.contains("move");
	if (isBan == isMove) {
		return {};
	}

	const auto& payload = isBan ? value.at("ban") : value.at("move");
	const auto from     = rules::parseSquare(payload.at("from").get<std::string>());
	const auto to       = rules::parseSquare(payload.at("to").get<std::string>());
	if (!from || !to) {
		return {};
	}

	rules::Action action{.type = isBan ? rules::ActionType::Ban : rules::ActionType::Move, .move = rules::Move{.from = *from, .to = *to}};
	if (isMove && payload.contains("promotion")) {
		const auto text = payload.at("promotion").get<std::string>();
		const auto type = text.size() == 1 ? rules::promotionFromChar(text.front()) : std::nullopt;
		if (!type) {
			return {};
		}
		action.move.promotion = *type;
	}
	return action;
}

static std::int64_t toMillis(engine::SystemTime time) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

static engine::SystemTime fromMillis(std::int64_t millis) {
	return engine::SystemTime{std::chrono::duration_cast<engine::SystemTime::duration>(std::chrono::milliseconds(millis))};
}

std::string toString(engine::Seat seat) {
	switch (seat) {
	case engine::Seat::White:
		return "white";
	case engine::Seat::Black:
		return "black";
	case engine::Seat::Black | engine::Seat::White:
		return "both";
	case engine::Seat::Observer:
		return "spectator";
	default:
		return "none";
	}
}

static std::optional<engine::Seat> seatFromString(std::string_view s) {
	using engine::Seat;
	for (const auto seat: {Seat::White, Seat::Black, Seat::Black | Seat::White, Seat::Observer, Seat::None}) {
		if (toString(seat) == s) {
			return seat;
		}
	}
	return {};
}

static json viewToJson(const engine::SessionView& view) {
	json history = json::array();
	for (const auto& entry: view.history) {
		history.push_back({
		        {"ply", entry.ply},
		        {"color", rules::toString(entry.color)},
		        {"bcn", rules::serializeAction(entry.action)},
		        {"timestamp", toMillis(entry.timestamp)},
		        {"fen", entry.fenAfter},
		});
	}

	json legal = json::array();
	for (const auto& move: view.legalActions) {
		legal.push_back(rules::toUci(move));
	}

	json result = nullptr;
	if (view.result) {
		result = {{"winner", colorToJson(view.result->winner)}, {"reason", engine::toString(view.result->reason)}};
	}

	json clock = nullptr;
	if (view.clock) {
		clock = {{"white", view.clock->white.count()}, {"black", view.clock->black.count()}, {"running", colorToJson(view.clock->running)}};
	}

	return {
	        {"sessionId", view.sessionId},
	        {"mode", engine::toString(view.mode)},
	        {"white", identityToJson(view.white)},
	        {"black", identityToJson(view.black)},
	        {"timeControl", timeControlToJson(view.timeControl)},
	        {"role", toString(view.role)},
	        {"fen", view.fen},
	        {"history", history},
	        {"pending", rules::toString(view.pending)},
	        {"actor", rules::toString(view.actor)},
	        {"legalActions", legal},
	        {"inCheck", view.inCheck},
	        {"status", engine::toString(view.status)},
	        {"result", result},
	        {"clock", clock},
	        {"drawOfferedBy", colorToJson(view.drawOfferedBy)},
	        {"version", view.version},
	};
}

static std::optional<engine::SessionView> viewFromJson(const json& value) {
	engine::SessionView view;
	view.sessionId   = value.at("sessionId").get<std::string>();
	view.white       = identityFromJson(value.at("white"));
	view.black       = identityFromJson(value.at("black"));
	view.timeControl = timeControlFromJson(value.at("timeControl"));
	view.fen         = value.at("fen").get<std::string>();
	view.actor       = colorFromJson(value.at("actor"));
	view.inCheck     = value.at("inCheck").get<bool>();
	view.version     = value.at("version").get<std::uint64_t>();

	const auto mode   = engine::gameModeFromString(value.at("mode").get<std::string>());
	const auto role   = seatFromString(value.at("role").get<std::string>());
	const auto status = engine::sessionStatusFromString(value.at("status").get<std::string>());
	if (!mode || !role || !status) {
		return {};
	}
	view.mode   = *mode;
	view.role   = *role;
	view.status = *status;

	const auto pending = value.at("pending").get<std::string>();
	if (pending == rules::toString(rules::ActionType::Ban)) {
		view.pending = rules::ActionType::Ban;
	} else if (pending == rules::toString(rules::ActionType::Move)) {
		view.pending = rules::ActionType::Move;
	} else {
		return {};
	}

	for (const auto& item: value.at("history")) {
		const auto action = rules::deserializeAction(item.at("bcn").get<std::string>());
		if (!action) {
			return {};
		}
		view.history.push_back(engine::HistoryEntry{
		        .ply       = item.at("ply").get<unsigned>(),
		        .color     = colorFromJson(item.at("color")),
		        .action    = *action,
		        .timestamp = fromMillis(item.at("timestamp").get<std::int64_t>()),
		        .fenAfter  = item.at("fen").get<std::string>(),
		});
	}

	for (const auto& item: value.at("legalActions")) {
		const auto move = rules::moveFromUci(item.get<std::string>());
		if (!move) {
			return {};
		}
		view.legalActions.push_back(*move);
	}

	if (const auto& result = value.at("result"); !result.is_null()) {
		const auto reason = engine::terminationReasonFromString(result.at("reason").get<std::string>());
		if (!reason) {
			return {};
		}
		view.result = engine::GameResult{.winner = optionalColorFromJson(result.at("winner")), .reason = *reason};
	}

	if (const auto& clock = value.at("clock"); !clock.is_null()) {
		view.clock = engine::ClockState{
		        .white   = std::chrono::milliseconds(clock.at("white").get<std::int64_t>()),
		        .black   = std::chrono::milliseconds(clock.at("black").get<std::int64_t>()),
		        .running = optionalColorFromJson(clock.at("running")),
		};
	}

	view.drawOfferedBy = optionalColorFromJson(value.at("drawOfferedBy"));
	return view;
}

// Client -> server

static json toJson(const ClientAuthenticate& e) {
	auto j        = typed(CLIENT_AUTHENTICATE);
	j["userId"]   = e.userId;
	j["username"] = e.username;
	if (!e.token.empty()) {
		j["token"] = e.token;
	}
	return j;
}
static json toJson(const ClientCreateSolo& e) {
	auto j = typed(CLIENT_CREATE_SOLO);
	writeRequest(j, e.timeControl);
	return j;
}
static json toJson(const ClientJoinQueue& e) {
	auto j = typed(CLIENT_JOIN_QUEUE);
	writeRequest(j, e.timeControl);
	return j;
}
static json toJson(const ClientLeaveQueue&) {
	return typed(CLIENT_LEAVE_QUEUE);
}
static json toJson(const ClientAttach& e) {
	auto j         = typed(CLIENT_ATTACH);
	j["sessionId"] = e.sessionId;
	return j;
}
static json toJson(const ClientDetach&) {
	return typed(CLIENT_DETACH);
}
static json toJson(const ClientAction& e) {
	auto j         = typed(CLIENT_ACTION);
	j["sessionId"] = e.sessionId;
	j.update(actionToJson(e.action));
	return j;
}
static json toJson(const ClientResign& e) {
	auto j         = typed(CLIENT_RESIGN);
	j["sessionId"] = e.sessionId;
	return j;
}
static json toJson(const ClientOfferDraw& e) {
	auto j         = typed(CLIENT_OFFER_DRAW);
	j["sessionId"] = e.sessionId;
	return j;
}
static json toJson(const ClientAcceptDraw& e) {
	auto j         = typed(CLIENT_ACCEPT_DRAW);
	j["sessionId"] = e.sessionId;
	return j;
}
static json toJson(const ClientGiveTime& e) {
	auto j         = typed(CLIENT_GIVE_TIME);
	j["sessionId"] = e.sessionId;
	if (e.seconds) {
		j["seconds"] = *e.seconds;
	}
	return j;
}
static json toJson(const ClientPing&) {
	return typed(CLIENT_PING);
}

std::string toMessage(const ClientEvent& event) {
	return std::visit([](const auto& ev) { return toJson(ev).dump(); }, event);
}

static std::optional<ClientEvent> parseClientEvent(const json& j) {
	const auto type = j.at("type").get<std::string>();

	if (type == CLIENT_AUTHENTICATE) {
		return ClientAuthenticate{
		        .userId   = j.at("userId").get<std::string>(),
		        .username = j.at("username").get<std::string>(),
		        .token    = j.value("token", std::string{}),
		};
	}
	if (type == CLIENT_CREATE_SOLO) {
		return ClientCreateSolo{.timeControl = readRequest(j)};
	}
	if (type == CLIENT_JOIN_QUEUE) {
		return ClientJoinQueue{.timeControl = readRequest(j)};
	}
	if (type == CLIENT_LEAVE_QUEUE) {
		return ClientLeaveQueue{};
	}
	if (type == CLIENT_ATTACH) {
		return ClientAttach{.sessionId = j.at("sessionId").get<std::string>()};
	}
	if (type == CLIENT_DETACH) {
		return ClientDetach{};
	}
	if (type == CLIENT_ACTION) {
		const auto action = actionFromJson(j);
		if (!action) {
			return {};
		}
		return ClientAction{.sessionId = j.at("sessionId").get<std::string>(), .action = *action};
	}
	if (type == CLIENT_RESIGN) {
		return ClientResign{.sessionId = j.at("sessionId").get<std::string>()};
	}
	if (type == CLIENT_OFFER_DRAW) {
		return ClientOfferDraw{.sessionId = j.at("sessionId").get<std::string>()};
	}
	if (type == CLIENT_ACCEPT_DRAW) {
		return ClientAcceptDraw{.sessionId = j.at("sessionId").get<std::string>()};
	}
	if (type == CLIENT_GIVE_TIME) {
		ClientGiveTime event{.sessionId = j.at("sessionId").get<std::string>(), .seconds = std::nullopt};
		if (j.contains("seconds")) {
			event.seconds = secondsFromJson(j.at("seconds"), 1, engine::MAX_GIVE_TIME_SECONDS);
		}
		return event;
	}
	if (type == CLIENT_PING) {
		return ClientPing{};
	}

	// Invalid
	return {};
}

std::optional<ClientEvent> fromClientMessage(const std::string& message) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return {};
	}

	try {
		return parseClientEvent(j);
	} catch (const std::exception&) { return {}; }
}

// Server -> client

static json toJson(const ServerAuthenticated& e) {
	auto j              = typed(SERVER_AUTHENTICATED);
	j["userId"]         = e.identity.userId;
	j["username"]       = e.identity.displayName;
	j["activeSessions"] = e.activeSessions;
	return j;
}
static json toJson(const ServerGameCreated& e) {
	auto j           = typed(SERVER_GAME_CREATED);
	j["sessionId"]   = e.sessionId;
	j["timeControl"] = timeControlToJson(e.timeControl);
	return j;
}
static json toJson(const ServerQueuePosition& e) {
	auto j        = typed(SERVER_QUEUE_POSITION);
	j["position"] = e.position;
	return j;
}
static json toJson(const ServerMatched& e) {
	auto j         = typed(SERVER_MATCHED);
	j["sessionId"] = e.sessionId;
	j["color"]     = rules::toString(e.color);
	j["opponent"]  = identityToJson(e.opponent);
	return j;
}
static json toJson(const ServerQueueLeft& e) {
	auto j      = typed(SERVER_QUEUE_LEFT);
	j["result"] = e.result == QueueLeftResult::Left ? "left" : "already-matched";
	if (e.sessionId) {
		j["sessionId"] = *e.sessionId;
	}
	return j;
}
static json toJson(const ServerDetached& e) {
	auto j         = typed(SERVER_DETACHED);
	j["sessionId"] = e.sessionId;
	return j;
}
static json toJson(const ServerState& e) {
	auto j = typed(SERVER_STATE);
	j.update(viewToJson(e.view));
	return j;
}
static json toJson(const ServerError& e) {
	auto j       = typed(SERVER_ERROR);
	j["code"]    = engine::toString(e.code);
	j["message"] = e.message;
	return j;
}
static json toJson(const ServerPong&) {
	return typed(SERVER_PONG);
}

std::string toMessage(const ServerEvent& event) {
	return std::visit([](const auto& ev) { return toJson(ev).dump(); }, event);
}

static std::optional<ServerEvent> parseServerEvent(const json& j) {
	const auto type = j.at("type").get<std::string>();

	if (type == SERVER_AUTHENTICATED) {
		return ServerAuthenticated{
		        .identity       = identityFromJson(j),
		        .activeSessions = j.value("activeSessions", std::vector<std::string>{}),
		};
	}
	if (type == SERVER_GAME_CREATED) {
		return ServerGameCreated{.sessionId = j.at("sessionId").get<std::string>(), .timeControl = timeControlFromJson(j.value("timeControl", json()))};
	}
	if (type == SERVER_QUEUE_POSITION) {
		return ServerQueuePosition{.position = j.at("position").get<std::size_t>()};
	}
	if (type == SERVER_MATCHED) {
		return ServerMatched{
		        .sessionId = j.at("sessionId").get<std::string>(),
		        .color     = colorFromJson(j.at("color")),
		        .opponent  = identityFromJson(j.at("opponent")),
		};
	}
	if (type == SERVER_QUEUE_LEFT) {
		const auto result = j.at("result").get<std::string>();
		ServerQueueLeft event{.result = QueueLeftResult::Left, .sessionId = std::nullopt};
		if (result == "already-matched") {
			event.result = QueueLeftResult::AlreadyMatched;
		} else if (result != "left") {
			return {};
		}
		if (j.contains("sessionId")) {
			event.sessionId = j.at("sessionId").get<std::string>();
		}
		return event;
	}
	if (type == SERVER_DETACHED) {
		return ServerDetached{.sessionId = j.at("sessionId").get<std::string>()};
	}
	if (type == SERVER_STATE) {
		auto view = viewFromJson(j);
		if (!view) {
			return {};
		}
		return ServerState{.view = std::move(*view)};
	}
	if (type == SERVER_ERROR) {
		const auto code = engine::errorFromString(j.at("code").get<std::string>());
		if (!code) {
			return {};
		}
		return ServerError{.code = *code, .message = j.value("message", std::string{})};
	}
	if (type == SERVER_PONG) {
		return ServerPong{};
	}

	// Invalid
	return {};
}

std::optional<ServerEvent> fromServerMessage(const std::string& message) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return {};
	}

	try {
		return parseServerEvent(j);
	} catch (const std::exception&) { return {}; }
}

} // namespace banchess::network
