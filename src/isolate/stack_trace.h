#pragma once
#include <v8.h>
#include <string>

namespace jsh {

/**
 * Renders a caught exception as `<file>:<line>: <message>`. `fallback_filename` is used when v8
 * has no resource name for the script that threw.
 */
auto RenderException(v8::Local<v8::Message> message, const std::string& fallback_filename) -> std::string;

// Same as above, for a value which never went through a v8::TryCatch (rejected promises)
auto RenderException(v8::Local<v8::Value> exception, const std::string& fallback_filename) -> std::string;

// Renders whatever is caught, or a generic message if v8 did not keep one
auto RenderException(const v8::TryCatch& try_catch, const std::string& fallback_filename) -> std::string;

} // namespace jsh
