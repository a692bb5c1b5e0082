#include "function.h"
#include "isolate/environment.h"
#include "isolate/util.h"

using namespace v8;

namespace jsh {

auto FunctionTable::Register(Local<v8::Function> function) -> Function {
	slots.emplace_back(Isolate::GetCurrent(), function);
	++live;
	return Function{runtime_id, static_cast<uint32_t>(slots.size() - 1)};
}

void FunctionTable::Check(const Function& function) const {
	if (function.GetRuntimeId() != runtime_id) {
		throw InvalidHandleError("function belongs to a different runtime");
	} else if (function.GetSlot() >= slots.size() || slots[function.GetSlot()].IsEmpty()) {
		throw InvalidHandleError("function has been released");
	}
}

auto FunctionTable::Get(const Function& function) const -> Local<v8::Function> {
	Check(function);
	return Deref(slots[function.GetSlot()]);
}

void FunctionTable::Release(const Function& function) {
	Check(function);
	slots[function.GetSlot()].Reset();
	--live;
}

auto HandleCastImpl(Local<Value> value, const HandleCastArguments& arguments, HandleCastTag<Function> /*tag*/) -> Function {
	auto function = HandleCast<Local<v8::Function>>(value, arguments);
	return IsolateEnvironment::GetCurrent()->function_table->Register(function);
}

auto HandleCastImpl(const Function& value, const HandleCastArguments& /*arguments*/, HandleCastTag<Local<Value>> /*tag*/) -> Local<Value> {
	return IsolateEnvironment::GetCurrent()->function_table->Get(value);
}

} // namespace jsh
