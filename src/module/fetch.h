#pragma once
#include "specifier.h"
#include <uv.h>
#include <exception>
#include <functional>
#include <string>

namespace jsh {

// Invoked on the loop thread with either an error or the raw module text
using FetchCallback = std::function<void(std::exception_ptr error, std::string text)>;

// Reads a `file:` module with libuv's asynchronous filesystem requests
void FetchFile(uv_loop_t* loop, const ModuleSpecifier& specifier, FetchCallback callback);

#ifdef JSH_URL_IMPORT
// Downloads an `http:` or `https:` module with libcurl on the libuv thread pool
void FetchUrl(uv_loop_t* loop, const ModuleSpecifier& specifier, FetchCallback callback);
#endif

} // namespace jsh
