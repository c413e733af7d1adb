#include "engine/persistence.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace banchess::engine {

using nlohmann::json;

static std::int64_t toMillis(SystemTime time) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

static SystemTime fromMillis(std::int64_t millis) {
	return SystemTime{std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds(millis))};
}

static json optionalTime(const std::optional<SystemTime>& time) {
	return time ? json(toMillis(*time)) : json(nullptr);
}

static std::optional<SystemTime> optionalTime(const json& value) {
	if (value.is_null()) {
		return {};
	}
	return fromMillis(value.get<std::int64_t>());
}

static json identityToJson(const Identity& identity) {
	return {{"userId", identity.userId}, {"username", identity.displayName}};
}

static Identity identityFromJson(const json& value) {
	return Identity{.userId = value.at("userId").get<std::string>(), .displayName = value.at("username").get<std::string>()};
}

//! Ids are generated by the registry; anything else never touches the filesystem.
static bool isSafeId(const SessionId& sessionId) {
	return !sessionId.empty() && std::ranges::all_of(sessionId, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '-'; });
}

GameRecord toRecord(const SessionState& state) {
	return GameRecord{
	        .sessionId    = state.id,
	        .mode         = state.mode,
	        .participants = state.participants,
	        .timeControl  = state.timeControl,
	        .history      = state.history,
	        .result       = state.result,
	        .createdAt    = state.createdAt,
	        .startedAt    = state.startedAt,
	        .finishedAt   = state.finishedAt,
	        .finalFen     = state.position.toFen(),
	};
}

json toJson(const GameRecord& record) {
	json history = json::array();
	for (const auto& entry: record.history) {
		history.push_back({
		        {"ply", entry.ply},
		        {"color", rules::toString(entry.color)},
		        {"bcn", rules::serializeAction(entry.action)},
		        {"timestamp", toMillis(entry.timestamp)},
		        {"fen", entry.fenAfter},
		});
	}

	json timeControl = nullptr;
	if (record.timeControl) {
		timeControl = {{"initial", record.timeControl->initialSeconds}, {"increment", record.timeControl->incrementSeconds}};
	}

	json result = nullptr;
	if (record.result) {
		result = {
		        {"winner", record.result->winner ? json(rules::toString(*record.result->winner)) : json(nullptr)},
		        {"reason", toString(record.result->reason)},
		};
	}

	return {
	        {"sessionId", record.sessionId},
	        {"mode", toString(record.mode)},
	        {"white", identityToJson(record.participants.white)},
	        {"black", identityToJson(record.participants.black)},
	        {"timeControl", timeControl},
	        {"history", history},
	        {"result", result},
	        {"createdAt", toMillis(record.createdAt)},
	        {"startedAt", optionalTime(record.startedAt)},
	        {"finishedAt", optionalTime(record.finishedAt)},
	        {"finalFen", record.finalFen},
	};
}

std::optional<GameRecord> recordFromJson(const json& value) {
	try {
		GameRecord record;
		record.sessionId = value.at("sessionId").get<std::string>();

		const auto mode = gameModeFromString(value.at("mode").get<std::string>());
		if (!mode) {
			return {};
		}
		record.mode         = *mode;
		record.participants = Participants{.white = identityFromJson(value.at("white")), .black = identityFromJson(value.at("black"))};

		if (const auto& tc = value.at("timeControl"); !tc.is_null()) {
			record.timeControl = TimeControl{.initialSeconds = tc.at("initial").get<unsigned>(), .incrementSeconds = tc.at("increment").get<unsigned>()};
		}

		for (const auto& item: value.at("history")) {
			const auto color  = rules::colorFromString(item.at("color").get<std::string>());
			const auto action = rules::deserializeAction(item.at("bcn").get<std::string>());
			if (!color || !action) {
				return {};
			}
			record.history.push_back(HistoryEntry{
			        .ply       = item.at("ply").get<unsigned>(),
			        .color     = *color,
			        .action    = *action,
			        .timestamp = fromMillis(item.at("timestamp").get<std::int64_t>()),
			        .fenAfter  = item.value("fen", std::string{}),
			});
		}

		if (const auto& result = value.at("result"); !result.is_null()) {
			const auto reason = terminationReasonFromString(result.at("reason").get<std::string>());
			if (!reason) {
				return {};
			}
			GameResult parsed{.winner = std::nullopt, .reason = *reason};
			if (const auto& winner = result.at("winner"); !winner.is_null()) {
				parsed.winner = rules::colorFromString(winner.get<std::string>());
				if (!parsed.winner) {
					return {};
				}
			}
			record.result = parsed;
		}

		record.createdAt  = fromMillis(value.at("createdAt").get<std::int64_t>());
		record.startedAt  = optionalTime(value.at("startedAt"));
		record.finishedAt = optionalTime(value.at("finishedAt"));
		record.finalFen   = value.at("finalFen").get<std::string>();
		return record;
	} catch (const json::exception&) {
		return {};
	}
}


JsonFilePersistenceSink::JsonFilePersistenceSink(std::filesystem::path directory) : m_directory(std::move(directory)) {
}

bool JsonFilePersistenceSink::save(const GameRecord& record) {
	if (!isSafeId(record.sessionId)) {
		return false;
	}

	std::lock_guard<std::mutex> lock(m_mutex);

	std::error_code ec{};
	std::filesystem::create_directories(m_directory, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Persistence] Could not create directory '{}': {}", m_directory.string(), ec.message()));
		return false;
	}

	const auto path = pathFor(record.sessionId);
	std::ofstream file(path, std::ios::trunc);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Persistence] Could not open '{}' for writing.", path.string()));
		return false;
	}
	file << toJson(record).dump(2);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Persistence] Writing '{}' failed.", path.string()));
		return false;
	}
	return true;
}

std::optional<GameRecord> JsonFilePersistenceSink::load(const SessionId& sessionId) {
	if (!isSafeId(sessionId)) {
		return {};
	}

	std::lock_guard<std::mutex> lock(m_mutex);

	std::ifstream file(pathFor(sessionId));
	if (!file) {
		return {};
	}

	const auto document = json::parse(file, nullptr, false);
	if (document.is_discarded()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Persistence] Record of '{}' is not valid JSON.", sessionId));
		return {};
	}
	return recordFromJson(document);
}

std::filesystem::path JsonFilePersistenceSink::pathFor(const SessionId& sessionId) const {
	return m_directory / (sessionId + ".json");
}

} // namespace banchess::engine
