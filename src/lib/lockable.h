#pragma once
#include <mutex>
#include <shared_mutex>
#include <type_traits>

namespace jsh {
namespace detail {

template <bool Shared>
struct mutex_traits_t {
	using mutex_t = std::mutex;
	using read_t = std::unique_lock<std::mutex>;
	using write_t = std::unique_lock<std::mutex>;
};

template <>
struct mutex_traits_t<true> {
	using mutex_t = std::shared_mutex;
	using read_t = std::shared_lock<std::shared_mutex>;
	using write_t = std::unique_lock<std::shared_mutex>;
};

// Holds the lock and provides pointer semantics
template <class Lockable, class Lock>
class lock_holder_t {
	public:
		explicit lock_holder_t(Lockable& lockable) : lockable{lockable}, lock{lockable.mutex} {}

		auto operator*() -> auto& { return lockable.resource; }
		auto operator*() const -> auto& { return lockable.resource; }
		auto operator->() { return &lockable.resource; }
		auto operator->() const { return &lockable.resource; }

	private:
		Lockable& lockable;
		Lock lock;
};

} // namespace detail

/**
 * Resource paired with the mutex which guards it. The resource is only reachable through the
 * holder returned by `read()` or `write()`.
 */
template <class Type, bool Shared = false>
class lockable_t {
	template <class, class> friend class detail::lock_holder_t;
	using traits_t = detail::mutex_traits_t<Shared>;

	public:
		lockable_t() = default;
		template <class... Args>
		explicit lockable_t(Args&&... args) : resource{std::forward<Args>(args)...} {}
		lockable_t(const lockable_t&) = delete;
		~lockable_t() = default;
		auto operator=(const lockable_t&) = delete;

		auto read() const {
			return detail::lock_holder_t<const lockable_t, typename traits_t::read_t>{*this};
		}

		auto write() {
			return detail::lock_holder_t<lockable_t, typename traits_t::write_t>{*this};
		}

	private:
		Type resource{};
		mutable typename traits_t::mutex_t mutex;
};

} // namespace jsh
