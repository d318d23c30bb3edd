#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/param_source.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::db::model {

struct FileReference {
  bool        store_contents = false;
  std::string path;        // path as given by the caller
  std::string content_key; // key in the content area when store_contents
};

// Numeric array held in the content area; data stays empty.
struct ArrayReference {
  std::string          content_key;
  std::string          dtype; // Arrow type name ("double", "int64", ...)
  std::vector<int64_t> shape;
  int64_t              chunk_length = 0;

  bool operator==(const ArrayReference&) const = default;
};

/*
  One unit of value data.

  unset -> set is one-way. type_lookup marks value paths that are tuples or
  sets, which the structured value cannot express on its own.
*/

struct ParameterRecord {
  uint64_t id     = 0;
  bool     is_set = false;

  google::protobuf::Value            data;
  std::map<std::string, std::string> type_lookup;
  std::optional<FileReference>       file;
  std::optional<ArrayReference>      array;

  ParamSource source;

  ParameterRecord WithValue(google::protobuf::Value value, std::map<std::string, std::string> types = {}) const {
    ThrowIfSet();
    ParameterRecord next = *this;
    next.is_set          = true;
    next.data            = std::move(value);
    next.type_lookup     = std::move(types);
    return next;
  }

  ParameterRecord WithFile(FileReference ref) const {
    ThrowIfSet();
    ParameterRecord next = *this;
    next.is_set          = true;
    next.file            = std::move(ref);
    return next;
  }

  ParameterRecord WithArray(ArrayReference ref) const {
    ThrowIfSet();
    ParameterRecord next = *this;
    next.is_set          = true;
    next.array           = std::move(ref);
    return next;
  }

  ParameterRecord WithSource(const ParamSource& update) const {
    ParameterRecord next = *this;
    next.source          = MergeSource(source, update);
    return next;
  }

 private:
  void ThrowIfSet() const {
    if (is_set) {
      throw util::InvariantViolation("parameter " + std::to_string(id) + " is already set");
    }
  }
};

} // namespace jobflow::db::model
