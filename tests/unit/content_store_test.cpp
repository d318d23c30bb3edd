#include <arrow/array.h>
#include <arrow/buffer.h>
#include <arrow/builder.h>
#include <arrow/chunked_array.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/storage/common/array_codec.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobflow::storage::ContentStore;

void VerifyWriteReadReplaceRemove(ContentStore& store) {
  assert(!store.Exists("1_input.txt"));

  bool threw = false;
  try {
    (void)store.Read("1_input.txt");
  } catch (const jobflow::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  store.Write("1_input.txt", arrow::Buffer::FromString("first"), false);
  assert(store.Exists("1_input.txt"));
  assert(store.Read("1_input.txt")->ToString() == "first");

  store.Write("1_input.txt", arrow::Buffer::FromString("second"), true);
  assert(store.Read("1_input.txt")->ToString() == "second");

  store.Remove("1_input.txt");
  assert(!store.Exists("1_input.txt"));
}

void VerifyKeysMustBeSingleComponents(ContentStore& store) {
  for (const std::string key : {"", "..", "a/b"}) {
    bool threw = false;
    try {
      store.Write(key, arrow::Buffer::FromString("x"), false);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestRamStore() {
  jobflow::storage::RamContentStore store;
  VerifyWriteReadReplaceRemove(store);
  VerifyKeysMustBeSingleComponents(store);
}

void TestDiskStore() {
  const auto root = std::filesystem::temp_directory_path() / "jobflow_content_store_tests";
  std::filesystem::remove_all(root);

  jobflow::storage::DiskContentStore store(root);
  VerifyWriteReadReplaceRemove(store);
  VerifyKeysMustBeSingleComponents(store);

  // contents survive a new store over the same root
  store.Write("2_data.bin", arrow::Buffer::FromString("kept"), true);
  jobflow::storage::DiskContentStore reopened(root);
  assert(reopened.Read("2_data.bin")->ToString() == "kept");
  assert(!std::filesystem::exists(root / "2_data.bin.tmp"));

  std::filesystem::remove_all(root);
}

void TestFactoryPicksBackendFromRoot() {
  jobflow::runtime::config::ContentConfig cfg;
  assert(std::dynamic_pointer_cast<jobflow::storage::RamContentStore>(jobflow::storage::StorageFactory::Build(cfg)));

  const auto root = std::filesystem::temp_directory_path() / "jobflow_content_factory_tests";
  cfg.set_root_path(root.string());
  assert(std::dynamic_pointer_cast<jobflow::storage::DiskContentStore>(jobflow::storage::StorageFactory::Build(cfg)));
  assert(std::filesystem::is_directory(root));
  std::filesystem::remove_all(root);
}

void TestContentKeys() {
  using jobflow::storage::common::ContentKeyFor;
  assert(ContentKeyFor(3, "/tmp/run/out.txt") == "3_out.txt");
  assert(ContentKeyFor(4, "data/") == "4_contents");
  assert(ContentKeyFor(5, "..") == "5_contents");
  assert(jobflow::storage::common::ArrayContentKeyFor(5) == "array_5");
}

std::shared_ptr<arrow::Array> Doubles(int n) {
  arrow::DoubleBuilder builder;
  for (int i = 0; i < n; ++i) jobflow::storage::common::Unwrap(builder.Append(0.5 * i));
  std::shared_ptr<arrow::Array> out;
  jobflow::storage::common::Unwrap(builder.Finish(&out));
  return out;
}

void TestArraysAreStoredInChunks() {
  using jobflow::storage::common::DecodeArray;
  using jobflow::storage::common::EncodeArray;

  auto values  = Doubles(10);
  auto decoded = DecodeArray(EncodeArray(*values, 4));
  assert(decoded->num_chunks() == 3);
  assert(decoded->length() == 10);
  assert(decoded->chunk(2)->length() == 2);
  assert(decoded->type()->Equals(arrow::float64()));

  const auto last = std::static_pointer_cast<arrow::DoubleArray>(decoded->chunk(2));
  assert(last->Value(1) == 4.5);
  assert(decoded->Equals(arrow::ChunkedArray(values)));

  // empty arrays keep their type
  auto empty = DecodeArray(EncodeArray(*Doubles(0)));
  assert(empty->length() == 0);
  assert(empty->type()->Equals(arrow::float64()));

  arrow::StringBuilder strings;
  jobflow::storage::common::Unwrap(strings.Append("x"));
  std::shared_ptr<arrow::Array> text;
  jobflow::storage::common::Unwrap(strings.Finish(&text));

  bool threw = false;
  try {
    (void)EncodeArray(*text);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "only numeric arrays are stored");

  threw = false;
  try {
    (void)DecodeArray(arrow::Buffer::FromString("not an arrow stream"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRamStore();
  TestDiskStore();
  TestFactoryPicksBackendFromRoot();
  TestContentKeys();
  TestArraysAreStoredInChunks();

  std::cout << "jobflow_unit_content_store: pass\n";
  return 0;
}
