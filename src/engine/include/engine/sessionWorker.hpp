#pragma once

#include "engine/ISessionObserver.hpp"
#include "engine/SafeQueue.hpp"
#include "engine/session.hpp"
#include "engine/timerService.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>

namespace banchess::engine {

// Commands processed by a session worker.
struct StartCommand {};
struct SubmitCommand {
	Seat seat;
	rules::Action action;
};
struct ResignCommand {
	Seat seat;
};
struct OfferDrawCommand {
	Seat seat;
};
struct AcceptDrawCommand {
	Seat seat;
};
struct GiveTimeCommand {
	Seat seat;
	unsigned seconds;
};
struct ClockExpiredCommand {
	std::uint64_t generation; //!< Expiries of an older generation are stale.
};
struct ForfeitCommand {
	rules::Color loser;
};
struct ShutdownCommand {};

using SessionCommand = std::variant<StartCommand, SubmitCommand, ResignCommand, OfferDrawCommand, AcceptDrawCommand, GiveTimeCommand,
                                    ClockExpiredCommand, ForfeitCommand, ShutdownCommand>;

//! Owns one Session and serialises every mutation on its own thread.
//! Accepted transitions are published as immutable states; the latest state can be read from any thread.
class SessionWorker : public std::enable_shared_from_this<SessionWorker> {
public:
	SessionWorker(Session session, TimerService& timers, ISessionObserver* observer);
	~SessionWorker();

	SessionWorker(const SessionWorker&)            = delete;
	SessionWorker& operator=(const SessionWorker&) = delete;
	SessionWorker(SessionWorker&&)                 = delete;
	SessionWorker& operator=(SessionWorker&&)      = delete;

	void start(); //!< Start the worker thread. Call once after the worker is owned by a shared_ptr.
	void stop();  //!< Process queued commands, then join. Safe to call multiple times.

	//! Queue a command. The future resolves once the command was processed.
	std::future<ErrorCode> post(SessionCommand command, OriginId origin = NO_ORIGIN);

	const SessionId& id() const;
	std::shared_ptr<const SessionState> state() const; //!< Latest published state.

private:
	struct Envelope {
		SessionCommand command;
		OriginId origin{NO_ORIGIN};
		std::shared_ptr<std::promise<ErrorCode>> result;
	};

	void run(); //!< Blocking loop: intended to live on its own thread.

	ErrorCode handle(const StartCommand& command);
	ErrorCode handle(const SubmitCommand& command);
	ErrorCode handle(const ResignCommand& command);
	ErrorCode handle(const OfferDrawCommand& command);
	ErrorCode handle(const AcceptDrawCommand& command);
	ErrorCode handle(const GiveTimeCommand& command);
	ErrorCode handle(const ClockExpiredCommand& command);
	ErrorCode handle(const ForfeitCommand& command);
	ErrorCode handle(const ShutdownCommand& command);

	void publish();       //!< Store and signal the current state if its version changed.
	void scheduleClock(); //!< Arm the expiry timer for the running color.

private:
	const SessionId m_id;
	Session m_session;
	TimerService& m_timers;
	ISessionObserver* m_observer{nullptr};

	SafeQueue<Envelope> m_queue;
	std::mutex m_postMutex;
	bool m_closed{false}; //!< No more commands are accepted. Guarded by m_postMutex.
	std::thread m_thread;
	bool m_running{false}; //!< Only touched by the worker thread.
	std::once_flag m_stopFlag;

	mutable std::mutex m_stateMutex;
	std::shared_ptr<const SessionState> m_state; //!< Latest published state.

	std::uint64_t m_clockGeneration{0};
	std::optional<TimerService::TimerId> m_clockTimer;
};

} // namespace banchess::engine
