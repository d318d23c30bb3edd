#pragma once

#include <google/protobuf/message.h>

#include <filesystem>

namespace jobflow::db::json {

/*
  One JSON document on disk, holding one protobuf message.

  Writes are atomic replace: write tmp -> flush -> rename.
*/

// Returns false when the file does not exist. Throws on unreadable or
// malformed content.
bool LoadDocument(const std::filesystem::path& path, google::protobuf::Message* message);

void DumpDocument(const std::filesystem::path& path, const google::protobuf::Message& message, bool fsync);

} // namespace jobflow::db::json
