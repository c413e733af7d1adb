#pragma once

#include "engine/session.hpp"
#include "engine/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace banchess::engine {

//! Minimal record to replay or resume a game.
struct GameRecord {
	SessionId sessionId;
	GameMode mode{GameMode::Online};
	Participants participants;
	std::optional<TimeControl> timeControl;
	std::vector<HistoryEntry> history; //!< Persisted as BCN ("b:e2e4", "m:e7e8q") with timestamps.
	std::optional<GameResult> result;
	SystemTime createdAt{};
	std::optional<SystemTime> startedAt;
	std::optional<SystemTime> finishedAt;
	std::string finalFen;
};

GameRecord toRecord(const SessionState& state);

nlohmann::json toJson(const GameRecord& record);
std::optional<GameRecord> recordFromJson(const nlohmann::json& json); //!< Empty on missing or malformed fields.

//! Receives finished games. Only read to seed resumed games.
class IPersistenceSink {
public:
	virtual ~IPersistenceSink() = default;

	virtual bool save(const GameRecord& record)                    = 0; //!< Returns false if the record could not be stored.
	virtual std::optional<GameRecord> load(const SessionId& sessionId) = 0;
};

//! Stores one JSON document per game: <directory>/<sessionId>.json
class JsonFilePersistenceSink final : public IPersistenceSink {
public:
	explicit JsonFilePersistenceSink(std::filesystem::path directory);

	bool save(const GameRecord& record) override;
	std::optional<GameRecord> load(const SessionId& sessionId) override;

private:
	std::filesystem::path pathFor(const SessionId& sessionId) const;

private:
	std::filesystem::path m_directory;
	std::mutex m_mutex; //!< Sessions finish on different worker threads.
};

} // namespace banchess::engine
