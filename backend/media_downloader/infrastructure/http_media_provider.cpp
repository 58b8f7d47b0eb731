#include "http_media_provider.hpp"
#include "media_json.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace media_downloader {

namespace {

// curl 回调的上下文
struct StreamContext {
  CURL* curl;
  PartialFileSink* sink;
  std::uint64_t expected_total;
  MediaProvider::ProgressCallback progress;
};

} // namespace

TransferError classifyTransfer(CURLcode code, long http_code) {
  if (code == CURLE_OPERATION_TIMEDOUT) {
    return TransferError::timeout(curl_easy_strerror(code));
  }
  // an error reply aborts the body write, so the HTTP status wins over CURLE_WRITE_ERROR
  if (http_code >= 400) {
    if (http_code == 408 || http_code == 504) {
      return TransferError::timeout("HTTP error: " + std::to_string(http_code));
    }
    return TransferError::failure("HTTP error: " + std::to_string(http_code));
  }
  if (code != CURLE_OK) {
    return TransferError::failure(curl_easy_strerror(code));
  }
  return TransferError::failure("Unexpected HTTP status: " + std::to_string(http_code));
}

std::expected<std::uint64_t, TransferError> transferResult(
  CURLcode code,
  long http_code,
  std::uint64_t resume_offset,
  const PartialFileSink& sink
) {
  if (sink.failed()) {
    return std::unexpected(TransferError::failure(sink.error()));
  }
  if (http_code == 416 && resume_offset > 0) {
    return std::uint64_t{0};
  }
  if (code != CURLE_OK || http_code >= 400) {
    return std::unexpected(classifyTransfer(code, http_code));
  }
  return sink.written();
}

HttpMediaProvider::HttpMediaProvider(const config::ProviderConfig& cfg) : cfg_(cfg) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

HttpMediaProvider::~HttpMediaProvider() {
  curl_global_cleanup();
}

std::string HttpMediaProvider::mediaUrl(const std::string& collection_id, const std::string& id) const {
  auto escape = [](const std::string& s) {
    char* escaped = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
    if (!escaped) {
      return s;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
  };
  auto base = cfg_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + escape(collection_id) + "/" + escape(id);
}

// Each call gets its own easy handle: handles must not be shared between threads.
HttpMediaProvider::CurlHandle HttpMediaProvider::newHandle(const std::string& url, curl_slist*& headers) const {
  CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    return curl;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout.count()));
  // a transfer below 1 byte/s for stall_timeout is reported as CURLE_OPERATION_TIMEDOUT
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.stall_timeout.count()));

  if (!cfg_.auth_token.empty()) {
    headers = curl_slist_append(headers,
      ("Authorization: Bearer " + cfg_.auth_token).c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
  }
  return curl;
}

std::expected<MediaDescriptor, TransferError> HttpMediaProvider::resolve(
  const std::string& collection_id,
  const std::string& id
) {
  curl_slist* headers = nullptr;
  auto curl = newHandle(mediaUrl(collection_id, id) + "/meta", headers);
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, curl_slist_free_all);
  if (!curl) {
    return std::unexpected(TransferError::failure("Failed to initialize CURL handle"));
  }

  std::string body;
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

  auto res = curl_easy_perform(curl.get());
  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (res != CURLE_OK || http_code != 200) {
    return std::unexpected(classifyTransfer(res, http_code));
  }

  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    return std::unexpected(TransferError::failure("Malformed media metadata for " + collection_id + "/" + id));
  }
  auto media = mediaFromJson(json, collection_id);
  if (!media) {
    return std::unexpected(TransferError::failure(media.error()));
  }
  media->id = id;
  return media.value();
}

std::expected<std::uint64_t, TransferError> HttpMediaProvider::streamInto(
  const MediaDescriptor& media,
  const std::filesystem::path& destination,
  std::uint64_t resume_offset,
  ProgressCallback progress_callback
) {
  curl_slist* headers = nullptr;
  auto curl = newHandle(mediaUrl(media.collection_id, media.id), headers);
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, curl_slist_free_all);
  if (!curl) {
    return std::unexpected(TransferError::failure("Failed to initialize CURL handle"));
  }

  PartialFileSink sink(destination, resume_offset);
  StreamContext context{
    .curl = curl.get(),
    .sink = &sink,
    .expected_total = media.size_bytes,
    .progress = std::move(progress_callback)
  };

  // CURLOPT_RANGE instead of CURLOPT_RESUME_FROM: a server that ignores the
  // range is handled by the sink rather than failing the transfer
  std::string range;
  if (resume_offset > 0) {
    range = std::to_string(resume_offset) + "-";
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
  }
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToFile);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);

  auto res = curl_easy_perform(curl.get());
  sink.close();

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  return transferResult(res, http_code, resume_offset, sink);
}

size_t HttpMediaProvider::writeToString(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(static_cast<char*>(ptr), size * nmemb);
  return size * nmemb;
}

size_t HttpMediaProvider::writeToFile(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* context = static_cast<StreamContext*>(userdata);
  long http_code = 0;
  curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &http_code);
  return context->sink->write(static_cast<const char*>(ptr), size * nmemb, http_code);
}

int HttpMediaProvider::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                        curl_off_t, curl_off_t) {
  auto* context = static_cast<StreamContext*>(clientp);
  if (!context->progress) {
    return 0;
  }

  auto offset = context->sink->offset();
  std::uint64_t total = dltotal > 0
    ? offset + static_cast<std::uint64_t>(dltotal)
    : context->expected_total;
  context->progress(offset + static_cast<std::uint64_t>(dlnow), total);
  return 0;
}

} // namespace media_downloader
