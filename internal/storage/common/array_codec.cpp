#include "internal/storage/common/array_codec.hpp"

#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <arrow/type_traits.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"

namespace jobflow::storage::common {

namespace {

constexpr const char* kValuesColumn = "values";

} // namespace

std::shared_ptr<arrow::Buffer> EncodeArray(const arrow::Array& values, int64_t chunk_length) {
  if (!arrow::is_numeric(values.type_id())) {
    throw std::invalid_argument("array parameters must be numeric, got " + values.type()->ToString());
  }
  if (chunk_length <= 0) {
    throw std::invalid_argument("array chunk length must be positive");
  }

  auto schema = arrow::schema({arrow::field(kValuesColumn, values.type())});
  auto sink   = Unwrap(arrow::io::BufferOutputStream::Create());
  auto writer = Unwrap(arrow::ipc::MakeStreamWriter(sink, schema));

  for (int64_t offset = 0; offset < values.length(); offset += chunk_length) {
    const auto length = std::min(chunk_length, values.length() - offset);
    auto       batch  = arrow::RecordBatch::Make(schema, length, {values.Slice(offset, length)});
    Unwrap(writer->WriteRecordBatch(*batch));
  }

  Unwrap(writer->Close());
  return Unwrap(sink->Finish());
}

std::shared_ptr<arrow::ChunkedArray> DecodeArray(const std::shared_ptr<arrow::Buffer>& buffer) {
  auto input  = std::make_shared<arrow::io::BufferReader>(buffer);
  auto reader = Unwrap(arrow::ipc::RecordBatchStreamReader::Open(input));

  const auto schema = reader->schema();
  if (schema->num_fields() != 1 || schema->field(0)->name() != kValuesColumn) {
    throw std::runtime_error("array stream has an unexpected schema: " + schema->ToString());
  }

  arrow::ArrayVector chunks;
  while (true) {
    std::shared_ptr<arrow::RecordBatch> batch;
    Unwrap(reader->ReadNext(&batch));
    if (!batch) break;
    chunks.push_back(batch->column(0));
  }

  return Unwrap(arrow::ChunkedArray::Make(std::move(chunks), schema->field(0)->type()));
}

} // namespace jobflow::storage::common
