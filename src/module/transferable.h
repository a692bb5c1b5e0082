#pragma once
#include "isolate/generic/handle_cast.h"
#include <v8.h>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsh {

/**
 * A host value waiting to be handed to script. Each argument is encoded on its own when the call
 * is made, inside the runtime which receives it.
 */
class Transferable {
	public:
		Transferable() = default;
		Transferable(const Transferable&) = delete;
		auto operator=(const Transferable&) = delete;
		virtual ~Transferable() = default;

		virtual auto TransferIn() -> v8::Local<v8::Value> = 0;
};

template <class Type>
class TransferableValue final : public Transferable {
	public:
		explicit TransferableValue(Type value) : value{std::move(value)} {}

		auto TransferIn() -> v8::Local<v8::Value> final {
			return HandleCast<v8::Local<v8::Value>>(value);
		}

	private:
		Type value;
};

using Arguments = std::vector<std::shared_ptr<Transferable>>;

template <class Type>
auto Arg(Type&& value) -> std::shared_ptr<Transferable> {
	using value_t = std::decay_t<Type>;
	if constexpr (std::is_same_v<value_t, const char*> || std::is_same_v<value_t, char*>) {
		return std::make_shared<TransferableValue<std::string>>(std::string{value});
	} else {
		return std::make_shared<TransferableValue<value_t>>(std::forward<Type>(value));
	}
}

// MakeArguments("a", 1, true)
template <class... Types>
auto MakeArguments(Types&&... values) -> Arguments {
	return Arguments{Arg(std::forward<Types>(values))...};
}

} // namespace jsh
