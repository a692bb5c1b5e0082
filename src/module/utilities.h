#pragma once
#include "module_wrapper.h"
#include "runtime.h"
#include <string>

namespace jsh {

// Evaluates an expression in a fresh runtime
template <class Type>
auto Evaluate(const std::string& javascript) -> Type {
	Runtime runtime;
	return runtime.Eval<Type>(javascript);
}

/**
 * Loads `javascript` as a module in a fresh runtime. Returns false if it fails to compile or
 * throws, other errors are rethrown.
 */
auto Validate(const std::string& javascript) -> bool;

// Loads a module file into a fresh runtime
auto Import(const std::string& path) -> ModuleWrapper;

// Absolute `file:` URL of a path, relative paths are resolved against the working directory
auto ResolvePathUrl(const std::string& path) -> std::string;

} // namespace jsh
