#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace banchess::engine {

//! One-shot timers on a dedicated IO thread.
//! \note Callbacks run on the timer thread. They should only enqueue work for the owning component.
class TimerService {
public:
	using TimerId  = std::uint64_t;
	using Callback = std::function<void()>;

	TimerService();
	~TimerService();

	TimerService(const TimerService&)            = delete;
	TimerService& operator=(const TimerService&) = delete;
	TimerService(TimerService&&)                 = delete;
	TimerService& operator=(TimerService&&)      = delete;

	void start(); //!< Start the timer thread. Safe to call multiple times.
	void stop();  //!< Drop pending timers and join the thread. Safe to call multiple times.

	TimerId schedule(std::chrono::milliseconds delay, Callback callback); //!< Run callback once after delay.
	void cancel(TimerId id);                                              //!< Cancel a pending timer. No-op if it already fired.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace banchess::engine
