#include "fetch.h"
#include "isolate/generic/error.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace jsh {
namespace {

std::once_flag curl_once;

struct UrlFetchRequest {
	uv_work_t work{};
	std::string url;
	std::string body;
	std::string error;
	long status = 0;
	FetchCallback callback;
};

auto WriteCallback(char* data, size_t size, size_t count, void* user) -> size_t {
	auto* request = static_cast<UrlFetchRequest*>(user);
	request->body.append(data, size * count);
	return size * count;
}

// Runs on the libuv thread pool
void Perform(uv_work_t* work) {
	auto* request = static_cast<UrlFetchRequest*>(work->data);
	CURL* curl = curl_easy_init();
	if (curl == nullptr) {
		request->error = "curl_easy_init failed";
		return;
	}
	curl_easy_setopt(curl, CURLOPT_URL, request->url.c_str());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, request);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
	CURLcode result = curl_easy_perform(curl);
	if (result == CURLE_OK) {
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &request->status);
	} else {
		request->error = curl_easy_strerror(result);
	}
	curl_easy_cleanup(curl);
}

// Back on the loop thread
void AfterPerform(uv_work_t* work, int status) {
	std::unique_ptr<UrlFetchRequest> request{static_cast<UrlFetchRequest*>(work->data)};
	if (status < 0) {
		request->callback(std::make_exception_ptr(IoError(request->url + ": " + uv_strerror(status))), {});
	} else if (!request->error.empty()) {
		request->callback(std::make_exception_ptr(IoError(request->url + ": " + request->error)), {});
	} else if (request->status >= 400) {
		request->callback(std::make_exception_ptr(IoError(request->url + ": HTTP " + std::to_string(request->status))), {});
	} else {
		request->callback(nullptr, std::move(request->body));
	}
}

} // anonymous namespace

void FetchUrl(uv_loop_t* loop, const ModuleSpecifier& specifier, FetchCallback callback) {
	std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
	auto request = std::make_unique<UrlFetchRequest>();
	request->url = specifier.ToString();
	request->callback = std::move(callback);
	request->work.data = request.get();
	int status = uv_queue_work(loop, &request->work, Perform, AfterPerform);
	if (status < 0) {
		request->callback(std::make_exception_ptr(IoError(request->url + ": " + uv_strerror(status))), {});
		return;
	}
	request.release();
}

} // namespace jsh
