#include "fetch.h"
#include "isolate/generic/error.h"
#include <fcntl.h>
#include <memory>

namespace jsh {
namespace {

/**
 * open -> read... -> close, each step is a uv_fs request on the runtime's loop. The
 * request owns itself until the close callback runs.
 */
class FileFetchRequest {
	public:
		FileFetchRequest(std::string path, FetchCallback callback) :
			path{std::move(path)}, callback{std::move(callback)} {
			request.data = this;
		}

		void Start(uv_loop_t* loop) {
			this->loop = loop;
			int status = uv_fs_open(loop, &request, path.c_str(), O_RDONLY, 0, OnOpen);
			if (status < 0) {
				uv_fs_req_cleanup(&request);
				Finish(status);
			}
		}

	private:
		static void OnOpen(uv_fs_t* request) {
			auto* self = static_cast<FileFetchRequest*>(request->data);
			auto result = request->result;
			uv_fs_req_cleanup(request);
			if (result < 0) {
				self->Finish(static_cast<int>(result));
				return;
			}
			self->file = static_cast<uv_file>(result);
			self->ReadNext();
		}

		void ReadNext() {
			chunk.resize(64 * 1024);
			uv_buf_t buffer = uv_buf_init(chunk.data(), static_cast<unsigned int>(chunk.size()));
			int status = uv_fs_read(loop, &request, file, &buffer, 1, static_cast<int64_t>(contents.size()), OnRead);
			if (status < 0) {
				uv_fs_req_cleanup(&request);
				error = status;
				Close();
			}
		}

		static void OnRead(uv_fs_t* request) {
			auto* self = static_cast<FileFetchRequest*>(request->data);
			auto result = request->result;
			uv_fs_req_cleanup(request);
			if (result < 0) {
				self->error = static_cast<int>(result);
				self->Close();
			} else if (result == 0) {
				self->Close();
			} else {
				self->contents.append(self->chunk.data(), static_cast<size_t>(result));
				self->ReadNext();
			}
		}

		void Close() {
			int status = uv_fs_close(loop, &request, file, OnClose);
			if (status < 0) {
				uv_fs_req_cleanup(&request);
				Finish(error);
			}
		}

		static void OnClose(uv_fs_t* request) {
			auto* self = static_cast<FileFetchRequest*>(request->data);
			uv_fs_req_cleanup(request);
			self->Finish(self->error);
		}

		void Finish(int status) {
			std::unique_ptr<FileFetchRequest> self{this};
			if (status < 0) {
				callback(std::make_exception_ptr(IoError(path + ": " + uv_strerror(status))), {});
			} else {
				callback(nullptr, std::move(contents));
			}
		}

		uv_loop_t* loop = nullptr;
		uv_fs_t request{};
		uv_file file = -1;
		int error = 0;
		std::string path;
		std::string chunk;
		std::string contents;
		FetchCallback callback;
};

} // anonymous namespace

void FetchFile(uv_loop_t* loop, const ModuleSpecifier& specifier, FetchCallback callback) {
	auto* request = new FileFetchRequest{specifier.ToFilePath(), std::move(callback)};
	request->Start(loop);
}

} // namespace jsh
