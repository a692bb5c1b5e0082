#pragma once
// Everything an embedder needs: runtimes, modules, the cache providers and the one-shot helpers.
#include "../isolate/generic/error.h"
#include "../lib/log.h"
#include "../module/extension.h"
#include "../module/module.h"
#include "../module/module_cache.h"
#include "../module/module_wrapper.h"
#include "../module/runtime.h"
#include "../module/transpiler.h"
#include "../module/utilities.h"
#include "../module/value.h"
