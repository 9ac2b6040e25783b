#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "cashgraph/services/v1/ledger_service.grpc.pb.h"
#include "cashgraph/v1.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

using namespace cashgraph::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cashgraphctl <addr> ingest <events.json>\n"
            << "  cashgraphctl <addr> consolidate <tenant> [since_ms] [as_of_ms]\n"
            << "  cashgraphctl <addr> exceptions <tenant> [open|resolved|all]\n"
            << "  cashgraphctl <addr> resolve <exception_id> <note> [KIND:from_id:to_id[:weight] ...]\n"
            << "  cashgraphctl <addr> payouts <tenant> [from_ms] [to_ms]\n"
            << "  cashgraphctl <addr> provenance <identity_id> [max_depth]\n"
            << "  cashgraphctl <addr> ledger <tenant> [from_ms] [to_ms]\n"
            << "\n"
            << "events.json holds a cashgraph.services.v1.IngestRequest in protobuf JSON.\n"
            << "KIND is SETTLES, COMPOSED_OF or APPLIES_TO.\n";
}

static std::optional<EdgeKind> ParseEdgeKind(const std::string& value) {
  if (value == "SETTLES") return EDGE_KIND_SETTLES;
  if (value == "COMPOSED_OF") return EDGE_KIND_COMPOSED_OF;
  if (value == "APPLIES_TO") return EDGE_KIND_APPLIES_TO;
  return std::nullopt;
}

static std::optional<ChosenEdge> ParseEdge(const std::string& text) {
  std::istringstream in(text);
  std::string        kind, from, to, weight;
  if (!std::getline(in, kind, ':') || !std::getline(in, from, ':') || !std::getline(in, to, ':')) return std::nullopt;
  std::getline(in, weight, ':');

  auto parsed = ParseEdgeKind(kind);
  if (!parsed) return std::nullopt;

  ChosenEdge edge;
  edge.set_kind(*parsed);
  edge.set_from_identity_id(from);
  edge.set_to_identity_id(to);
  if (!weight.empty()) edge.set_weight(std::stod(weight));
  return edge;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = LedgerService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "ingest") {
      std::ifstream file(argv[3]);
      if (!file) {
        std::cerr << "cannot open " << argv[3] << "\n";
        return 1;
      }
      std::stringstream buffer;
      buffer << file.rdbuf();

      IngestRequest req;
      auto          parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
      if (!parsed.ok()) {
        std::cerr << "invalid ingest file: " << parsed.ToString() << "\n";
        return 1;
      }

      IngestResponse resp;
      auto           status = stub->Ingest(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "consolidate") {
      ConsolidateRequest req;
      req.set_tenant_id(argv[3]);
      if (argc >= 5) *req.mutable_since() = cashgraph::util::MillisToProto(std::stoll(argv[4]));
      if (argc >= 6) *req.mutable_as_of() = cashgraph::util::MillisToProto(std::stoll(argv[5]));

      ConsolidateResponse resp;
      auto                status = stub->Consolidate(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "exceptions") {
      ListExceptionsRequest req;
      req.set_tenant_id(argv[3]);
      const std::string filter = argc >= 5 ? argv[4] : "open";
      if (filter == "open") {
        req.set_status(EXCEPTION_STATUS_OPEN);
      } else if (filter == "resolved") {
        req.set_status(EXCEPTION_STATUS_RESOLVED);
      } else if (filter != "all") {
        std::cerr << "unsupported filter: " << filter << "\n";
        return 1;
      }

      ListExceptionsResponse resp;
      auto                   status = stub->ListExceptions(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "resolve") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      ResolveExceptionRequest req;
      req.set_exception_id(argv[3]);
      req.set_note(argv[4]);
      for (int i = 5; i < argc; ++i) {
        auto edge = ParseEdge(argv[i]);
        if (!edge) {
          std::cerr << "invalid edge: " << argv[i] << "\n";
          return 1;
        }
        *req.add_edges() = *edge;
      }

      ResolveExceptionResponse resp;
      auto                     status = stub->ResolveException(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "payouts") {
      ListPayoutsRequest req;
      req.set_tenant_id(argv[3]);
      if (argc >= 5) *req.mutable_from() = cashgraph::util::MillisToProto(std::stoll(argv[4]));
      if (argc >= 6) *req.mutable_to() = cashgraph::util::MillisToProto(std::stoll(argv[5]));

      ListPayoutsResponse resp;
      auto                status = stub->ListPayouts(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "provenance") {
      GetProvenanceRequest req;
      req.set_identity_id(argv[3]);
      if (argc >= 5) req.set_max_depth(static_cast<uint32_t>(std::stoul(argv[4])));

      GetProvenanceResponse resp;
      auto                  status = stub->GetProvenance(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "ledger") {
      ListLedgerRequest req;
      req.set_tenant_id(argv[3]);
      if (argc >= 5) *req.mutable_from() = cashgraph::util::MillisToProto(std::stoll(argv[4]));
      if (argc >= 6) *req.mutable_to() = cashgraph::util::MillisToProto(std::stoll(argv[5]));

      ListLedgerResponse resp;
      auto               status = stub->ListLedger(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << cashgraph::util::ToJson(resp) << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoll / std::stod on malformed numbers
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
