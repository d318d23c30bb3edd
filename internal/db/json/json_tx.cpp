#include "json_tx.hpp"

#include <stdexcept>

#include "json_document.hpp"

namespace jobflow::db::json {

JsonTransaction::JsonTransaction(JsonRepository& repo, const std::vector<std::string>& resources, AccessMode mode)
    : repo_(repo), resources_(resources.begin(), resources.end()), mode_(mode), snapshot_(repo.Snapshot()) {
  if (mode_ != AccessMode::kWrite) return;
  if (resources_.contains(JsonRepository::kMetadataResource)) metadata_ = *snapshot_.metadata;
  if (resources_.contains(JsonRepository::kParametersResource)) parameters_ = *snapshot_.parameters;
  if (resources_.contains(JsonRepository::kSubmissionsResource)) submissions_ = *snapshot_.submissions;
}

JsonTransaction::~JsonTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void JsonTransaction::Commit() {
  if (mode_ == AccessMode::kRead) {
    committed_ = true;
    return;
  }

  JsonRepository::Documents changed;
  if (resources_.contains(JsonRepository::kMetadataResource)) {
    DumpDocument(repo_.PathOf(JsonRepository::kMetadataResource), metadata_, repo_.fsync_);
    changed.metadata = std::make_shared<const v1::MetadataDocument>(std::move(metadata_));
  }
  if (resources_.contains(JsonRepository::kParametersResource)) {
    DumpDocument(repo_.PathOf(JsonRepository::kParametersResource), parameters_, repo_.fsync_);
    changed.parameters = std::make_shared<const v1::ParametersDocument>(std::move(parameters_));
  }
  if (resources_.contains(JsonRepository::kSubmissionsResource)) {
    DumpDocument(repo_.PathOf(JsonRepository::kSubmissionsResource), submissions_, repo_.fsync_);
    changed.submissions = std::make_shared<const v1::SubmissionsDocument>(std::move(submissions_));
  }

  repo_.Publish(changed);
  committed_ = true;
}

void JsonTransaction::Rollback() {
  rolled_back_ = true;
}

void JsonTransaction::Require(const char* resource) const {
  if (!resources_.contains(resource)) {
    throw std::logic_error(std::string("resource not held by transaction: ") + resource);
  }
}

void JsonTransaction::RequireWrite(const char* resource) const {
  Require(resource);
  if (mode_ != AccessMode::kWrite) {
    throw std::logic_error(std::string("resource opened read-only: ") + resource);
  }
}

const v1::MetadataDocument& JsonTransaction::Metadata() const {
  Require(JsonRepository::kMetadataResource);
  return mode_ == AccessMode::kWrite ? metadata_ : *snapshot_.metadata;
}

const v1::ParametersDocument& JsonTransaction::Parameters() const {
  Require(JsonRepository::kParametersResource);
  return mode_ == AccessMode::kWrite ? parameters_ : *snapshot_.parameters;
}

const v1::SubmissionsDocument& JsonTransaction::Submissions() const {
  Require(JsonRepository::kSubmissionsResource);
  return mode_ == AccessMode::kWrite ? submissions_ : *snapshot_.submissions;
}

v1::MetadataDocument& JsonTransaction::MutableMetadata() {
  RequireWrite(JsonRepository::kMetadataResource);
  return metadata_;
}

v1::ParametersDocument& JsonTransaction::MutableParameters() {
  RequireWrite(JsonRepository::kParametersResource);
  return parameters_;
}

v1::SubmissionsDocument& JsonTransaction::MutableSubmissions() {
  RequireWrite(JsonRepository::kSubmissionsResource);
  return submissions_;
}

} // namespace jobflow::db::json
