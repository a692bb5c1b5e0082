#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace jsh {

/**
 * One-shot timers which fire on a shared background thread. These are used to interrupt runaway
 * script from outside the thread which is running it, so they cannot live on a libuv loop.
 */
struct timer_data_t;
class timer_t {
	public:
		using callback_t = std::function<void()>;

		// Runs a callback unless the `timer_t` destructor is called first.
		timer_t(std::chrono::milliseconds timeout, callback_t callback);
		timer_t(const timer_t&) = delete;
		~timer_t();
		auto operator= (const timer_t&) = delete;

	private:
		std::shared_ptr<timer_data_t> data;
};

} // namespace jsh
