#include "json_document.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace jobflow::db::json {

namespace {

void SyncFile(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw std::runtime_error("open for fsync failed: " + path.string());
  }
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw std::runtime_error("fsync failed: " + path.string());
  }
}

} // namespace

bool LoadDocument(const std::filesystem::path& path, google::protobuf::Message* message) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (!std::filesystem::exists(path)) return false;
    throw std::runtime_error("failed to open document: " + path.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), message, options);
  if (!status.ok()) {
    throw std::runtime_error("malformed document " + path.string() + ": " + std::string(status.message()));
  }
  return true;
}

void DumpDocument(const std::filesystem::path& path, const google::protobuf::Message& message, bool fsync) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialise document " + path.string() + ": " + std::string(status.message()));
  }

  auto tmp_path = path;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + tmp_path.string() + " for writing");
    }
    out << json;
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write " + tmp_path.string());
    }
  }

  if (fsync) SyncFile(tmp_path);

  std::filesystem::rename(tmp_path, path);
}

} // namespace jobflow::db::json
