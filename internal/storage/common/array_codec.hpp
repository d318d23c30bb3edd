#pragma once

#include <arrow/array.h>
#include <arrow/buffer.h>
#include <arrow/chunked_array.h>

#include <cstdint>
#include <memory>

namespace jobflow::storage::common {

inline constexpr int64_t kDefaultArrayChunkLength = 65536;

/*
  Numeric parameter arrays in the content area.

  Stored as an Arrow IPC stream with one column ("values"); every record
  batch holds at most chunk_length values, so a reader can stream a large
  array chunk by chunk. Only numeric Arrow types are accepted
  (std::invalid_argument otherwise).
*/
std::shared_ptr<arrow::Buffer> EncodeArray(const arrow::Array& values, int64_t chunk_length = kDefaultArrayChunkLength);

// Throws std::runtime_error on a malformed stream.
std::shared_ptr<arrow::ChunkedArray> DecodeArray(const std::shared_ptr<arrow::Buffer>& buffer);

} // namespace jobflow::storage::common
