#pragma once

#include <google/protobuf/struct.pb.h>

#include <map>
#include <string>

namespace jobflow::db::model {

inline constexpr const char* kComponentParameters   = "parameters";
inline constexpr const char* kComponentCommandFiles = "command_files";
inline constexpr const char* kComponentEnvironments = "environments";
inline constexpr const char* kComponentTaskSchemas  = "task_schemas";

// component type -> content hash -> component document
using TemplateComponents = std::map<std::string, std::map<std::string, google::protobuf::Struct>>;

// Hashes already present are left untouched.
inline void MergeComponents(TemplateComponents& into, const TemplateComponents& added) {
  for (const auto& [type, by_hash] : added) {
    auto& dst = into[type];
    for (const auto& [hash, doc] : by_hash) dst.try_emplace(hash, doc);
  }
}

} // namespace jobflow::db::model
