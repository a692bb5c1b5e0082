#pragma once
#include <stdexcept>
#include <string>
#include <v8.h>

namespace jsh {

/**
 * Errors visible to the host. Every fallible public operation throws one of these.
 */
enum class ErrorKind {
	ValueNotFound,
	ValueNotCallable,
	MissingEntrypoint,
	Timeout,
	Runtime,
	Permission,
	Resolution,
	Io,
	Serialization,
	InvalidHandle,
};

inline auto ErrorKindName(ErrorKind kind) -> const char* {
	switch (kind) {
		case ErrorKind::ValueNotFound: return "ValueNotFound";
		case ErrorKind::ValueNotCallable: return "ValueNotCallable";
		case ErrorKind::MissingEntrypoint: return "MissingEntrypoint";
		case ErrorKind::Timeout: return "Timeout";
		case ErrorKind::Runtime: return "Runtime";
		case ErrorKind::Permission: return "Permission";
		case ErrorKind::Resolution: return "Resolution";
		case ErrorKind::Io: return "Io";
		case ErrorKind::Serialization: return "Serialization";
		case ErrorKind::InvalidHandle: return "InvalidHandle";
	}
	return "Unknown";
}

class Error : public std::runtime_error {
	public:
		Error(ErrorKind kind, const std::string& what) : std::runtime_error{what}, kind{kind} {}

		auto GetKind() const -> ErrorKind {
			return kind;
		}

	private:
		ErrorKind kind;
};

// Name was neither a global nor a module export, or was null / undefined
class ValueNotFoundError final : public Error {
	public:
		explicit ValueNotFoundError(const std::string& name) :
			Error{ErrorKind::ValueNotFound, name + " could not be found in global, or module exports"} {}
};

class ValueNotCallableError final : public Error {
	public:
		explicit ValueNotCallableError(const std::string& name) :
			Error{ErrorKind::ValueNotCallable, name + " is not a function"} {}
};

class MissingEntrypointError final : public Error {
	public:
		explicit MissingEntrypointError(const std::string& filename) :
			Error{ErrorKind::MissingEntrypoint, filename + " has no entrypoint. Register one, or add a default to the runtime"} {}
};

class TimeoutError final : public Error {
	public:
		explicit TimeoutError(const std::string& what) : Error{ErrorKind::Timeout, what} {}
};

// Script threw, or the runtime could not carry out the request
class RuntimeError final : public Error {
	public:
		explicit RuntimeError(const std::string& what) : Error{ErrorKind::Runtime, what} {}
};

class PermissionError final : public Error {
	public:
		explicit PermissionError(const std::string& what) : Error{ErrorKind::Permission, what} {}
};

class ResolutionError final : public Error {
	public:
		explicit ResolutionError(const std::string& what) : Error{ErrorKind::Resolution, what} {}
};

class IoError final : public Error {
	public:
		explicit IoError(const std::string& what) : Error{ErrorKind::Io, what} {}
};

class SerializationError final : public Error {
	public:
		explicit SerializationError(const std::string& what) : Error{ErrorKind::Serialization, what} {}
};

class InvalidHandleError final : public Error {
	public:
		explicit InvalidHandleError(const std::string& what) : Error{ErrorKind::InvalidHandle, what} {}
};

/**
 * JS + C++ exceptions, internal use only
 */

// `ScriptException` can be thrown when v8 already has an exception on deck
class ScriptException : public std::exception {};

namespace detail {

// `ScriptErrorWithMessage` is a general error that has an error message with it
class ScriptErrorWithMessage : public ScriptException {
	public:
		explicit ScriptErrorWithMessage(std::string message) : message{std::move(message)} {}

		auto GetMessage() const {
			return message;
		}

	private:
		std::string message;
};

// `ScriptErrorConstructible` is an abstract error that can be thrown into v8
class ScriptErrorConstructible : public ScriptErrorWithMessage {
	using ScriptErrorWithMessage::ScriptErrorWithMessage;
	public:
		virtual auto ConstructError() const -> v8::Local<v8::Value> = 0;
};

// `ScriptErrorWithConstructor` can be used to construct any of the `v8::Exception` errors
template <v8::Local<v8::Value> (*Error)(v8::Local<v8::String>)>
class ScriptErrorWithConstructor : public ScriptErrorConstructible {
	using ScriptErrorConstructible::ScriptErrorConstructible;
	public:
		auto ConstructError() const -> v8::Local<v8::Value> final {
			v8::Isolate* isolate = v8::Isolate::GetCurrent();
			v8::Local<v8::String> message_handle;
			if (v8::String::NewFromUtf8(isolate, GetMessage().c_str(), v8::NewStringType::kNormal).ToLocal(&message_handle)) {
				return Error(message_handle);
			}
			// v8 will have an exception on deck
			return {};
		}
};

} // namespace detail

// These correspond to the given JS error types
using ScriptGenericError = detail::ScriptErrorWithConstructor<v8::Exception::Error>;
using ScriptTypeError = detail::ScriptErrorWithConstructor<v8::Exception::TypeError>;
using ScriptRangeError = detail::ScriptErrorWithConstructor<v8::Exception::RangeError>;

/**
 * Convert a MaybeLocal<T> to Local<T> and throw an error if it's empty. Someone else should throw
 * the v8 exception.
 */
template <class Type>
auto Unmaybe(v8::Maybe<Type> handle) -> Type {
	Type just;
	if (handle.To(&just)) {
		return just;
	} else {
		throw ScriptException();
	}
}

template <class Type>
auto Unmaybe(v8::MaybeLocal<Type> handle) -> v8::Local<Type> {
	v8::Local<Type> local;
	if (handle.ToLocal(&local)) {
		return local;
	} else {
		throw ScriptException();
	}
}

namespace detail {

template <class Functor>
inline void RunBarrier(Functor fn) {
	// Runs a function and converts C++ errors to immediate v8 errors
	try {
		fn();
	} catch (const detail::ScriptErrorConstructible& cc_error) {
		v8::Local<v8::Value> error = cc_error.ConstructError();
		if (!error.IsEmpty()) {
			v8::Isolate::GetCurrent()->ThrowException(error);
		}
	} catch (const ScriptException& cc_error) {
		// A JS error is waiting in the isolate
	} catch (const Error& cc_error) {
		// Host errors raised inside a native callback become plain JS errors
		ScriptGenericError error{cc_error.what()};
		v8::Local<v8::Value> value = error.ConstructError();
		if (!value.IsEmpty()) {
			v8::Isolate::GetCurrent()->ThrowException(value);
		}
	}
}

} // namespace detail
} // namespace jsh
