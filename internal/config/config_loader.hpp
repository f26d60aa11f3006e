#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "cardposter/v1/card.pb.h"
#include "cardposter/v1/export.pb.h"
#include "config/config.pb.h"

namespace cardposter::config {

/*
  Loads protobuf-backed configuration and job input files.

  YAML is converted to JSON then parsed into protobuf; files ending in
  ".json" are parsed as JSON directly. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static cardposter::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static cardposter::v1::ExportConfig LoadExportConfig(const std::string& path);
  static cardposter::v1::CardList     LoadCardList(const std::string& path);

  // Fills unset runtime fields with their documented defaults.
  static void ApplyDefaults(cardposter::runtime::config::RuntimeConfig& config);

  static void ParseFile(const std::string& path, google::protobuf::Message* message);
};

} // namespace cardposter::config
