#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "json_repository.hpp"

namespace jobflow::db::json {

/*
  Holds the documents for the requested resources only. Touching a
  document outside that set is a programming error (std::logic_error).
*/
class JsonTransaction final : public db::Transaction {
 public:
  JsonTransaction(JsonRepository& repo, const std::vector<std::string>& resources, AccessMode mode);
  ~JsonTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const v1::MetadataDocument&    Metadata() const;
  const v1::ParametersDocument&  Parameters() const;
  const v1::SubmissionsDocument& Submissions() const;

  v1::MetadataDocument&    MutableMetadata();
  v1::ParametersDocument&  MutableParameters();
  v1::SubmissionsDocument& MutableSubmissions();

 private:
  void Require(const char* resource) const;
  void RequireWrite(const char* resource) const;

  JsonRepository&       repo_;
  std::set<std::string> resources_;
  AccessMode            mode_;

  JsonRepository::Documents snapshot_;

  // Write copies, created for held resources in write mode.
  v1::MetadataDocument    metadata_;
  v1::ParametersDocument  parameters_;
  v1::SubmissionsDocument submissions_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace jobflow::db::json
