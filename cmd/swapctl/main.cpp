#include <grpcpp/grpcpp.h>

#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "atomicswap/coordinator/v1.hpp"

using namespace atomicswap::coordinator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  swapctl [--addr host:port] create <init_asset> <init_amount> <acc_asset> <acc_amount> <init_address>\n"
            << "  swapctl [--addr host:port] accept <id> <address>\n"
            << "  swapctl [--addr host:port] lock-initiator <id>\n"
            << "  swapctl [--addr host:port] lock-acceptor <id>\n"
            << "  swapctl [--addr host:port] claim-initiator <id>\n"
            << "  swapctl [--addr host:port] claim-acceptor <id> [secret]\n"
            << "  swapctl [--addr host:port] refund-initiator <id>\n"
            << "  swapctl [--addr host:port] refund-acceptor <id>\n"
            << "  swapctl [--addr host:port] cancel <id>\n"
            << "  swapctl [--addr host:port] get <id>\n"
            << "  swapctl [--addr host:port] list [status|open|active]\n"
            << "  swapctl [--addr host:port] balances\n";
}

static std::string StatusName(SwapStatus status) {
  // SWAP_STATUS_INITIATOR_LOCKED -> initiator_locked
  std::string name = SwapStatus_Name(status);
  const std::string prefix = "SWAP_STATUS_";
  if (name.rfind(prefix, 0) == 0) name = name.substr(prefix.size());
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

static std::optional<SwapStatus> ParseStatus(const std::string& value) {
  std::string upper = "SWAP_STATUS_";
  for (char c : value) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  SwapStatus status = SWAP_STATUS_UNSPECIFIED;
  if (!SwapStatus_Parse(upper, &status) || status == SWAP_STATUS_UNSPECIFIED) {
    return std::nullopt;
  }
  return status;
}

static void PrintField(const char* key, const std::string& value) {
  if (!value.empty()) std::cout << key << "=" << value << "\n";
}

static void PrintTime(const char* key, const google::protobuf::Timestamp& ts) {
  if (ts.seconds() != 0) std::cout << key << "=" << ts.seconds() << "\n";
}

static void PrintOffer(const SwapOffer& offer) {
  std::cout << "id=" << offer.id() << "\n";
  std::cout << "status=" << StatusName(offer.status()) << "\n";
  std::cout << "initiator=" << offer.initiator_amount() << " " << offer.initiator_asset() << "\n";
  std::cout << "acceptor=" << offer.acceptor_amount() << " " << offer.acceptor_asset() << "\n";
  PrintField("initiator_address", offer.initiator_address());
  PrintField("acceptor_address", offer.acceptor_address());
  PrintField("hashlock", offer.hashlock());
  PrintTime("initiator_timelock", offer.initiator_timelock());
  PrintTime("acceptor_timelock", offer.acceptor_timelock());
  PrintField("initiator_txid", offer.initiator_txid());
  PrintField("acceptor_txid", offer.acceptor_txid());
  PrintField("initiator_claim_txid", offer.initiator_claim_txid());
  PrintField("acceptor_claim_txid", offer.acceptor_claim_txid());
  PrintField("initiator_refund_txid", offer.initiator_refund_txid());
  PrintField("acceptor_refund_txid", offer.acceptor_refund_txid());
  PrintField("last_error", offer.last_error());
  PrintTime("failed_at", offer.failed_at());
  PrintTime("created_at", offer.created_at());
  PrintTime("accepted_at", offer.accepted_at());
  PrintTime("completed_at", offer.completed_at());
  std::cout << "version=" << offer.version() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

// Issues a unary call and prints resp.offer().
template <typename Req, typename Resp, typename Call>
static int OfferCall(const Req& req, Call&& call) {
  grpc::ClientContext ctx;
  Resp                resp;
  auto                status = call(&ctx, req, &resp);
  if (!status.ok()) return Fail(status);
  PrintOffer(resp.offer());
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string addr = "localhost:50071";
  if (args.size() >= 2 && args[0] == "--addr") {
    addr = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SwapCoordinatorService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (args.size() < 6) {
      Usage();
      return 1;
    }

    CreateOfferRequest req;
    req.set_initiator_asset(args[1]);
    req.set_initiator_amount(args[2]);
    req.set_acceptor_asset(args[3]);
    req.set_acceptor_amount(args[4]);
    req.set_initiator_address(args[5]);

    return OfferCall<CreateOfferRequest, CreateOfferResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->CreateOffer(ctx, r, resp); });
  }

  // ------------------------------------------------------------

  if (cmd == "accept") {
    if (args.size() < 3) {
      Usage();
      return 1;
    }

    AcceptOfferRequest req;
    req.set_id(args[1]);
    req.set_acceptor_address(args[2]);

    return OfferCall<AcceptOfferRequest, AcceptOfferResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->AcceptOffer(ctx, r, resp); });
  }

  // ------------------------------------------------------------

  if (cmd == "claim-initiator") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    ClaimInitiatorRequest req;
    req.set_id(args[1]);

    grpc::ClientContext    ctx;
    ClaimInitiatorResponse resp;
    auto                   status = stub->ClaimInitiator(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintOffer(resp.offer());
    std::cout << "secret=" << resp.secret() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim-acceptor") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    ClaimAcceptorRequest req;
    req.set_id(args[1]);
    if (args.size() >= 3) req.set_secret(args[2]);

    return OfferCall<ClaimAcceptorRequest, ClaimAcceptorResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->ClaimAcceptor(ctx, r, resp); });
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListOffersRequest req;
    if (args.size() >= 2) {
      if (args[1] == "open") {
        req.set_view(OFFER_VIEW_OPEN);
      } else if (args[1] == "active") {
        req.set_view(OFFER_VIEW_ACTIVE);
      } else if (args[1] == "all") {
        req.set_view(OFFER_VIEW_ALL);
      } else {
        auto parsed = ParseStatus(args[1]);
        if (!parsed.has_value()) {
          std::cerr << "unsupported status: " << args[1] << "\n";
          return 1;
        }
        req.set_status(parsed.value());
      }
    }

    grpc::ClientContext ctx;
    ListOffersResponse  resp;
    auto                status = stub->ListOffers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& offer : resp.offers()) {
      std::cout << offer.id() << " " << StatusName(offer.status()) << " " << offer.initiator_amount() << " " << offer.initiator_asset()
                << " -> " << offer.acceptor_amount() << " " << offer.acceptor_asset() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balances") {
    grpc::ClientContext ctx;
    GetBalancesRequest  req;
    GetBalancesResponse resp;
    auto                status = stub->GetBalances(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& balance : resp.balances()) {
      std::cout << balance.asset() << "=" << balance.amount() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  // Commands taking only an id
  // ------------------------------------------------------------

  if (args.size() < 2) {
    Usage();
    return 1;
  }
  const std::string& id = args[1];

  if (cmd == "lock-initiator") {
    LockInitiatorFundsRequest req;
    req.set_id(id);
    return OfferCall<LockInitiatorFundsRequest, LockInitiatorFundsResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->LockInitiatorFunds(ctx, r, resp); });
  }

  if (cmd == "lock-acceptor") {
    LockAcceptorFundsRequest req;
    req.set_id(id);
    return OfferCall<LockAcceptorFundsRequest, LockAcceptorFundsResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->LockAcceptorFunds(ctx, r, resp); });
  }

  if (cmd == "refund-initiator") {
    RefundInitiatorRequest req;
    req.set_id(id);
    return OfferCall<RefundInitiatorRequest, RefundInitiatorResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->RefundInitiator(ctx, r, resp); });
  }

  if (cmd == "refund-acceptor") {
    RefundAcceptorRequest req;
    req.set_id(id);
    return OfferCall<RefundAcceptorRequest, RefundAcceptorResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->RefundAcceptor(ctx, r, resp); });
  }

  if (cmd == "cancel") {
    CancelOfferRequest req;
    req.set_id(id);
    return OfferCall<CancelOfferRequest, CancelOfferResponse>(
        req, [&](auto* ctx, const auto& r, auto* resp) { return stub->CancelOffer(ctx, r, resp); });
  }

  if (cmd == "get") {
    GetOfferRequest req;
    req.set_id(id);
    return OfferCall<GetOfferRequest, GetOfferResponse>(req,
                                                        [&](auto* ctx, const auto& r, auto* resp) { return stub->GetOffer(ctx, r, resp); });
  }

  Usage();
  return 1;
}
