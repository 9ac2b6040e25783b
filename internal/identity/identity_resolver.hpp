#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/fingerprint/fingerprint_engine.hpp"

namespace cashgraph::identity {

struct Resolution {
  db::model::IdentityRecord     identity;
  db::model::IdentityLinkRecord link;
  fingerprint::FingerprintResult fingerprint;
  bool                          identity_created = false;
};

/*
  IdentityResolver

  Binds a stored raw event to its canonical identity inside the caller's
  ingestion transaction:

    fingerprint -> insert-or-fetch identity on (tenant, fingerprint)
                -> link raw event -> bump touched_at

  Writes at most one identity and one link. An existing identity is never
  rewritten; a fingerprint owned by an identity of another canonical kind
  is an integrity violation (util::InvalidState).
*/
class IdentityResolver {
 public:
  explicit IdentityResolver(std::shared_ptr<db::Repository> repository);

  Resolution Resolve(db::Transaction& tx, const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload, uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  fingerprint::FingerprintEngine   engine_;
};

} // namespace cashgraph::identity
