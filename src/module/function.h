#pragma once
#include "isolate/generic/handle_cast.h"
#include <v8.h>
#include <cstdint>
#include <vector>

namespace jsh {

/**
 * A script function captured by the host. This is an index into the function table of the
 * runtime which produced it, so it may be copied around and stored freely. Calling it against any
 * other runtime fails with `InvalidHandleError`.
 */
class Function {
	public:
		Function() = default;
		Function(uint64_t runtime_id, uint32_t slot) : runtime_id{runtime_id}, slot{slot} {}

		auto GetRuntimeId() const -> uint64_t { return runtime_id; }
		auto GetSlot() const -> uint32_t { return slot; }

		auto operator==(const Function& right) const -> bool {
			return runtime_id == right.runtime_id && slot == right.slot;
		}
		auto operator!=(const Function& right) const -> bool {
			return !(*this == right);
		}

	private:
		uint64_t runtime_id = 0;
		uint32_t slot = 0;
};

/**
 * Per-runtime arena of functions captured by the host. A slot keeps its function alive until it
 * is released. Slots are never reused, so a stale handle can not alias a different function.
 */
class FunctionTable {
	public:
		explicit FunctionTable(uint64_t runtime_id) : runtime_id{runtime_id} {}
		FunctionTable(const FunctionTable&) = delete;
		auto operator=(const FunctionTable&) = delete;
		~FunctionTable() = default;

		auto Register(v8::Local<v8::Function> function) -> Function;
		auto Get(const Function& function) const -> v8::Local<v8::Function>;
		// Releases the slot, the handle is invalid afterwards
		void Release(const Function& function);
		// Number of functions which are still held
		auto Size() const -> size_t { return live; }

	private:
		void Check(const Function& function) const;

		uint64_t runtime_id;
		std::vector<v8::Global<v8::Function>> slots;
		size_t live = 0;
};

// Decoding a callable registers it with the current runtime
auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<Function> /*tag*/) -> Function;
auto HandleCastImpl(const Function& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/) -> v8::Local<v8::Value>;

} // namespace jsh
