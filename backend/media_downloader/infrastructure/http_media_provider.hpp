#pragma once
#include <memory>
#include <string>
#include <expected>
#include <curl/curl.h>
#include "common/config/config.hpp"
#include "domain/media_provider.hpp"
#include "infrastructure/partial_file_sink.hpp"

namespace media_downloader {

// Stalls and 408/504 replies are timeouts, everything else is a failure.
TransferError classifyTransfer(CURLcode code, long http_code);

// Outcome of one ranged GET: the bytes written, 0 when a resumed range starts
// at the end of the media (416), or the classified error.
std::expected<std::uint64_t, TransferError> transferResult(
  CURLcode code,
  long http_code,
  std::uint64_t resume_offset,
  const PartialFileSink& sink
);

// Fetches media from an HTTP mirror of the message source:
//   GET <base_url>/<collection>/<id>/meta  -> JSON descriptor
//   GET <base_url>/<collection>/<id>       -> raw bytes, Range-resumable
class HttpMediaProvider : public MediaProvider {
public:
  explicit HttpMediaProvider(const config::ProviderConfig& cfg);
  ~HttpMediaProvider() override;

  HttpMediaProvider(const HttpMediaProvider&) = delete;
  HttpMediaProvider& operator=(const HttpMediaProvider&) = delete;

  std::expected<MediaDescriptor, TransferError> resolve(
    const std::string& collection_id,
    const std::string& id
  ) override;

  std::expected<std::uint64_t, TransferError> streamInto(
    const MediaDescriptor& media,
    const std::filesystem::path& destination,
    std::uint64_t resume_offset,
    ProgressCallback progress_callback = nullptr
  ) override;

private:
  using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

  CurlHandle newHandle(const std::string& url, curl_slist*& headers) const;
  std::string mediaUrl(const std::string& collection_id, const std::string& id) const;

  static size_t writeToString(void* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t writeToFile(void* ptr, size_t size, size_t nmemb, void* userdata);
  static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

  config::ProviderConfig cfg_;
};

} // namespace media_downloader
