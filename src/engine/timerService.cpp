#include "engine/timerService.hpp"
#include "logging.hpp"

#include <asio.hpp>

#include <atomic>
#include <format>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace banchess::engine {

class TimerService::Implementation {
public:
	void start();
	void stop();

	TimerId schedule(std::chrono::milliseconds delay, Callback callback);
	void cancel(TimerId id);

private:
	asio::io_context m_ioContext{};
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< Timer thread running.
	std::atomic<TimerId> m_nextId{1};

	// Only touched on the IO thread.
	std::unordered_map<TimerId, std::shared_ptr<asio::steady_timer>> m_timers;
};

void TimerService::Implementation::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
}

void TimerService::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::post(m_ioContext, [this]() {
		for (auto& [id, timer]: m_timers) {
			timer->cancel();
		}
		m_timers.clear();
	});

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

TimerService::TimerId TimerService::Implementation::schedule(std::chrono::milliseconds delay, Callback callback) {
	const auto id = m_nextId++;

	asio::post(m_ioContext, [this, id, delay, callback = std::move(callback)]() mutable {
		if (!m_running) {
			return;
		}
		auto timer   = std::make_shared<asio::steady_timer>(m_ioContext, delay);
		m_timers[id] = timer;

		timer->async_wait([this, id, timer, callback = std::move(callback)](const asio::error_code& ec) {
			m_timers.erase(id);
			if (ec || !m_running) {
				return;
			}

			try {
				callback();
			} catch (const std::exception& ex) {
				Logger().Log(Logging::LogLevel::Error, std::format("[TimerService] Timer {} callback failed: {}", id, ex.what()));
			}
		});
	});

	return id;
}

void TimerService::Implementation::cancel(TimerId id) {
	asio::post(m_ioContext, [this, id]() {
		const auto it = m_timers.find(id);
		if (it == m_timers.end()) {
			return;
		}
		it->second->cancel();
		m_timers.erase(it);
	});
}


TimerService::TimerService() : m_pimpl(std::make_unique<Implementation>()) {
}

TimerService::~TimerService() {
	stop();
}

void TimerService::start() {
	m_pimpl->start();
}

void TimerService::stop() {
	m_pimpl->stop();
}

TimerService::TimerId TimerService::schedule(std::chrono::milliseconds delay, Callback callback) {
	return m_pimpl->schedule(delay, std::move(callback));
}

void TimerService::cancel(TimerId id) {
	m_pimpl->cancel(id);
}

} // namespace banchess::engine
