#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cardposter::config {

using cardposter::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static std::string ReadText(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static std::string YamlFileToJson(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML " + path + ": " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }
  return json;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

void ConfigLoader::ParseFile(const std::string& path, google::protobuf::Message* message) {
  const bool  is_json = std::filesystem::path(path).extension() == ".json";
  std::string json    = is_json ? ReadText(path) : YamlFileToJson(path);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + message->GetDescriptor()->name() + " in " + path + ": " + std::string(status.message()));
  }
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  ParseFile(path, &config);
  ApplyDefaults(config);
  return config;
}

cardposter::v1::ExportConfig ConfigLoader::LoadExportConfig(const std::string& path) {
  cardposter::v1::ExportConfig config;
  ParseFile(path, &config);
  return config;
}

cardposter::v1::CardList ConfigLoader::LoadCardList(const std::string& path) {
  cardposter::v1::CardList cards;
  ParseFile(path, &cards);
  return cards;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* cache = config.mutable_cache();
  if (cache->root().empty()) {
    const char* home = std::getenv("HOME");
    cache->set_root((std::filesystem::path(home ? home : ".") / ".card-poster" / "cache").string());
  }
  if (cache->index_case() == cardposter::runtime::config::CacheConfig::INDEX_NOT_SET) {
    cache->mutable_sqlite()->set_wal_mode(true);
  }
  if (cache->has_sqlite() && cache->sqlite().path().empty()) {
    cache->mutable_sqlite()->set_path((std::filesystem::path(cache->root()) / "cache_index.db").string());
  }

  auto* downloader = config.mutable_downloader();
  if (downloader->workers() == 0) downloader->set_workers(8);
  if (downloader->timeout_ms() == 0) downloader->set_timeout_ms(10000);
  if (downloader->max_retries() == 0) downloader->set_max_retries(3);
  if (downloader->base_backoff_ms() == 0) downloader->set_base_backoff_ms(250);
  if (downloader->max_backoff_ms() == 0) downloader->set_max_backoff_ms(4000);
  if (downloader->user_agent().empty()) downloader->set_user_agent("card-poster/1.0");
  if (downloader->max_image_bytes() == 0) downloader->set_max_image_bytes(20ull * 1024 * 1024);

  auto* render = config.mutable_render();
  if (render->max_parallel_pages() == 0) render->set_max_parallel_pages(2);
  if (render->attribution().empty()) render->set_attribution("Exported by Card Poster");
  if (render->max_cards() == 0) render->set_max_cards(1000);
  if (!render->has_fsync()) render->set_fsync(true);

  auto* history = config.mutable_history();
  if (history->path().empty()) {
    history->set_path((std::filesystem::path(cache->root()) / "export_history.jsonl").string());
  }
}

} // namespace cardposter::config
