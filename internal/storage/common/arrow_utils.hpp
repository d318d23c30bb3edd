#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace jobflow::storage::common {

// Arrow status -> std::runtime_error
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Whole-file read. File parameters are small enough to hold in one buffer.
  Throws util::NotFound when the path does not exist.
*/
inline std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) throw util::NotFound("file " + path.string() + " does not exist");

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return Unwrap(file->Read(Unwrap(file->GetSize())));
}

/*
  Writes next to the target and renames over it, so a reader sees either
  the old contents or the new ones.
*/
inline void WriteFileAtomic(const std::filesystem::path& path, const arrow::Buffer& buffer, bool fsync) {
  const auto tmp_path = path.string() + ".tmp";

  auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
  Unwrap(out->Write(buffer.data(), buffer.size()));
  if (fsync) Unwrap(out->Flush());
  Unwrap(out->Close());

  std::filesystem::rename(tmp_path, path);
}

} // namespace jobflow::storage::common
