#pragma once
#include "domain/media.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace media_downloader {

struct MediaManifest {
  std::string collection_id;
  std::vector<MediaDescriptor> items;
};

// Item shape: {"id", "type": "photo"|"video"|"document", "name"?, "size",
// "width"?, "height"?, "duration"?}. "id" may be a number or a string.
std::expected<MediaDescriptor, std::string> mediaFromJson(
  const nlohmann::json& item,
  const std::string& collection_id
);

nlohmann::json mediaToJson(const MediaDescriptor& media);

// {"collection": ..., "items": [...]}; the collection id is normalized
std::expected<MediaManifest, std::string> loadManifest(const std::filesystem::path& path);

} // namespace media_downloader
