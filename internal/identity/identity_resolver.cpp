#include "identity_resolver.hpp"

#include <algorithm>

#include "internal/db/api/result_check.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace cashgraph::identity {

IdentityResolver::IdentityResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

Resolution IdentityResolver::Resolve(db::Transaction& tx, const db::model::RawEventRecord& event, const cashgraph::v1::RawPayload& payload,
                                     uint64_t now_ms) {
  Resolution resolution;
  resolution.fingerprint = engine_.Fingerprint(event, payload);

  auto& identity         = resolution.identity;
  identity.id            = util::NewId();
  identity.tenant_id     = event.tenant_id;
  identity.fingerprint   = resolution.fingerprint.key;
  identity.kind          = resolution.fingerprint.kind;
  identity.created_at_ms = now_ms;
  identity.touched_at_ms = now_ms;

  db::ThrowIfDbError(repository_->InsertOrFetchIdentity(tx, identity, resolution.identity_created), "resolve identity");

  if (identity.kind != resolution.fingerprint.kind) {
    throw util::InvalidState("resolve identity: fingerprint " + identity.fingerprint + " already belongs to an identity of kind " +
                             cashgraph::v1::CanonicalKind_Name(identity.kind));
  }

  auto& link         = resolution.link;
  link.id            = util::NewId();
  link.tenant_id     = event.tenant_id;
  link.identity_id   = identity.id;
  link.raw_event_id  = event.id;
  link.confidence    = resolution.fingerprint.confidence;
  link.reason        = resolution.fingerprint.degraded() ? "degraded fingerprint: " + resolution.fingerprint.degraded_reason
                                                         : "fingerprint " + resolution.fingerprint.basis;
  link.created_at_ms = now_ms;

  db::ThrowIfDbError(repository_->InsertLink(tx, link), "link raw event");

  if (!resolution.identity_created) {
    db::ThrowIfDbError(repository_->TouchIdentity(tx, identity.id, now_ms), "touch identity");
    identity.touched_at_ms = std::max(identity.touched_at_ms, now_ms);
  }

  return resolution;
}

} // namespace cashgraph::identity
