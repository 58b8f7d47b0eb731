#include "media_json.hpp"
#include <fstream>

namespace media_downloader {

namespace {

std::expected<std::string, std::string> idToString(const nlohmann::json& id) {
  if (id.is_string()) {
    return id.get<std::string>();
  }
  if (id.is_number_integer()) {
    return std::to_string(id.get<long long>());
  }
  return std::unexpected("identifier must be a string or an integer, got " + std::string(id.type_name()));
}

} // namespace

std::expected<MediaDescriptor, std::string> mediaFromJson(
  const nlohmann::json& item,
  const std::string& collection_id
) {
  if (!item.is_object()) {
    return std::unexpected("Media item is not an object");
  }

  try {
    auto id = idToString(item.at("id"));
    if (!id) {
      return std::unexpected("Invalid media item: " + id.error());
    }

    MediaDescriptor media;
    media.id = std::move(id.value());
    media.collection_id = collection_id;
    media.size_bytes = item.value("size", std::uint64_t{0});
    if (item.contains("name") && !item.at("name").is_null()) {
      media.name = item.at("name").get<std::string>();
    }

    auto type = item.at("type").get<std::string>();
    if (type == "photo") {
      media.payload = PhotoMedia{};
    } else if (type == "video") {
      media.payload = VideoMedia{
        .width = item.value("width", 0),
        .height = item.value("height", 0),
        .duration_seconds = item.value("duration", 0)
      };
    } else if (type == "document") {
      media.payload = DocumentMedia{};
    } else {
      return std::unexpected("Unknown media type: " + type);
    }
    return media;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(std::string("Invalid media item: ") + e.what());
  }
}

nlohmann::json mediaToJson(const MediaDescriptor& media) {
  nlohmann::json item = {
    {"id", media.id},
    {"size", media.size_bytes}
  };
  if (media.name) {
    item["name"] = *media.name;
  }

  switch (media.kind()) {
    case MediaKind::Photo:
      item["type"] = "photo";
      break;
    case MediaKind::Video: {
      const auto& v = media.video();
      item["type"] = "video";
      item["width"] = v.width;
      item["height"] = v.height;
      item["duration"] = v.duration_seconds;
      break;
    }
    case MediaKind::Document:
      item["type"] = "document";
      break;
  }
  return item;
}

std::expected<MediaManifest, std::string> loadManifest(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected("Failed to open manifest " + path.string());
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected("Invalid manifest " + path.string() + ": " + e.what());
  }

  MediaManifest manifest;
  try {
    auto collection = idToString(root.at("collection"));
    if (!collection) {
      return std::unexpected("Invalid manifest " + path.string() + ": collection " + collection.error());
    }
    manifest.collection_id = normalizeCollectionId(collection.value());
    const auto& items = root.at("items");
    if (!items.is_array()) {
      return std::unexpected("Invalid manifest " + path.string() + ": items must be an array");
    }
    manifest.items.reserve(items.size());
    for (const auto& item : items) {
      auto media = mediaFromJson(item, manifest.collection_id);
      if (!media) {
        return std::unexpected("Invalid manifest " + path.string() + ": " + media.error());
      }
      manifest.items.push_back(std::move(media.value()));
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("Invalid manifest " + path.string() + ": " + e.what());
  }
  return manifest;
}

} // namespace media_downloader
