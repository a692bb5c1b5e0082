#include "timer.h"
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace jsh {

/**
 * Contains data on a timer. This is shared between the timer_t handle and the timer thread.
 */
struct timer_data_t {
	timer_data_t(std::chrono::steady_clock::time_point timeout, timer_t::callback_t callback) :
		callback{std::move(callback)}, timeout{timeout} {}

	struct cmp {
		auto operator()(const std::shared_ptr<timer_data_t>& left, const std::shared_ptr<timer_data_t>& right) const {
			return left->timeout > right->timeout;
		}
	};

	timer_t::callback_t callback;
	std::chrono::steady_clock::time_point timeout;
	bool is_alive = true;
	bool is_running = false;
};

namespace {

/**
 * Stashed in a shared_ptr in case statics are destroyed while the library is unloading but the
 * thread is still active
 */
struct shared_state_t {
	std::priority_queue<
		std::shared_ptr<timer_data_t>,
		std::vector<std::shared_ptr<timer_data_t>>,
		timer_data_t::cmp
	> queue;
	std::condition_variable cv;
	std::condition_variable done_cv;
	std::mutex mutex;
	bool has_thread = false;
};
auto global_shared_state = std::make_shared<shared_state_t>();

void timer_thread_entry(std::shared_ptr<shared_state_t> state) {
	std::unique_lock<std::mutex> lock{state->mutex};
	while (true) {
		if (state->queue.empty()) {
			// Nothing left to do, the next timer will spawn a new thread
			state->has_thread = false;
			return;
		}
		auto next = state->queue.top();
		if (!next->is_alive) {
			state->queue.pop();
			continue;
		}
		if (std::chrono::steady_clock::now() < next->timeout) {
			state->cv.wait_until(lock, next->timeout);
			continue;
		}
		state->queue.pop();
		next->is_running = true;
		lock.unlock();
		next->callback();
		lock.lock();
		next->is_running = false;
		next->is_alive = false;
		state->done_cv.notify_all();
	}
}

} // anonymous namespace

/**
 * timer_t implementation
 */
timer_t::timer_t(std::chrono::milliseconds timeout, callback_t callback) :
		data{std::make_shared<timer_data_t>(std::chrono::steady_clock::now() + timeout, std::move(callback))} {
	auto state = global_shared_state;
	std::lock_guard<std::mutex> lock{state->mutex};
	state->queue.push(data);
	if (state->has_thread) {
		state->cv.notify_one();
	} else {
		state->has_thread = true;
		std::thread thread{timer_thread_entry, state};
		thread.detach();
	}
}

timer_t::~timer_t() {
	auto& state = *global_shared_state;
	std::unique_lock<std::mutex> lock{state.mutex};
	// Wait for a callback which is already underway
	state.done_cv.wait(lock, [&] { return !data->is_running; });
	data->is_alive = false;
	state.cv.notify_one();
}

} // namespace jsh
