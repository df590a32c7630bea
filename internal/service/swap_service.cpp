#include "swap_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/core/swap_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "swap_mapper.hpp"

namespace atomicswap::service {

using namespace atomicswap::coordinator::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* swap_id, Fn&& fn) {
  atomicswap::observability::SpanScope span(route);
  if (swap_id) {
    span.SetAttribute("swap.id", *swap_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    atomicswap::observability::Metrics::Instance().RecordRequest(route, true);
    atomicswap::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ATOMICSWAP_LOG_ERROR("RPC failed", {atomicswap::observability::StringField("route", route),
                                        atomicswap::observability::StringField("error", ex.what()),
                                        atomicswap::observability::StringField("swap_id", swap_id ? *swap_id : std::string())});
    atomicswap::observability::Metrics::Instance().RecordRequest(route, false);
    atomicswap::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void RequireId(const std::string& id, const char* route) {
  if (id.empty()) {
    throw atomicswap::util::Validation(std::string(route) + ": id is required");
  }
}

db::SwapFilter FilterFrom(const ListOffersRequest& req) {
  if (req.status() != SWAP_STATUS_UNSPECIFIED) {
    const auto status = FromProto(req.status());
    if (status == atomicswap::model::SwapStatus::kUnspecified) {
      throw atomicswap::util::Validation("list offers: unknown status");
    }
    return db::SwapFilter::ByStatus(status);
  }
  switch (req.view()) {
    case OFFER_VIEW_OPEN:
      return db::SwapFilter::Open();
    case OFFER_VIEW_ACTIVE:
      return db::SwapFilter::Active();
    case OFFER_VIEW_ALL:
      return db::SwapFilter::All();
    default:
      throw atomicswap::util::Validation("list offers: unknown view");
  }
}

} // namespace

SwapService::SwapService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.coordinator) {
    throw std::invalid_argument("swap service: coordinator is required");
  }
}

CreateOfferResponse SwapService::CreateOffer(const CreateOfferRequest& req) {
  return ObserveRpc("SwapCoordinatorService.CreateOffer", nullptr, [&] {
    core::CreateOfferParams params;
    params.initiator_asset   = req.initiator_asset();
    params.initiator_amount  = req.initiator_amount();
    params.acceptor_asset    = req.acceptor_asset();
    params.acceptor_amount   = req.acceptor_amount();
    params.initiator_address = req.initiator_address();

    CreateOfferResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->CreateOffer(params));
    return resp;
  });
}

AcceptOfferResponse SwapService::AcceptOffer(const AcceptOfferRequest& req) {
  return ObserveRpc("SwapCoordinatorService.AcceptOffer", &req.id(), [&] {
    RequireId(req.id(), "accept offer");
    AcceptOfferResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->AcceptOffer(req.id(), req.acceptor_address()));
    return resp;
  });
}

LockInitiatorFundsResponse SwapService::LockInitiatorFunds(const LockInitiatorFundsRequest& req) {
  return ObserveRpc("SwapCoordinatorService.LockInitiatorFunds", &req.id(), [&] {
    RequireId(req.id(), "lock initiator funds");
    LockInitiatorFundsResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->LockInitiatorFunds(req.id()));
    return resp;
  });
}

LockAcceptorFundsResponse SwapService::LockAcceptorFunds(const LockAcceptorFundsRequest& req) {
  return ObserveRpc("SwapCoordinatorService.LockAcceptorFunds", &req.id(), [&] {
    RequireId(req.id(), "lock acceptor funds");
    LockAcceptorFundsResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->LockAcceptorFunds(req.id()));
    return resp;
  });
}

ClaimInitiatorResponse SwapService::ClaimInitiator(const ClaimInitiatorRequest& req) {
  return ObserveRpc("SwapCoordinatorService.ClaimInitiator", &req.id(), [&] {
    RequireId(req.id(), "claim initiator");
    const auto claim = ctx_.coordinator->ClaimInitiator(req.id());

    ClaimInitiatorResponse resp;
    *resp.mutable_offer() = ToProto(claim.swap);
    resp.set_secret(claim.secret);
    return resp;
  });
}

ClaimAcceptorResponse SwapService::ClaimAcceptor(const ClaimAcceptorRequest& req) {
  return ObserveRpc("SwapCoordinatorService.ClaimAcceptor", &req.id(), [&] {
    RequireId(req.id(), "claim acceptor");
    std::optional<std::string> secret;
    if (!req.secret().empty()) secret = req.secret();

    ClaimAcceptorResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->ClaimAcceptor(req.id(), secret));
    return resp;
  });
}

RefundInitiatorResponse SwapService::RefundInitiator(const RefundInitiatorRequest& req) {
  return ObserveRpc("SwapCoordinatorService.RefundInitiator", &req.id(), [&] {
    RequireId(req.id(), "refund initiator");
    RefundInitiatorResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->RefundInitiator(req.id()));
    return resp;
  });
}

RefundAcceptorResponse SwapService::RefundAcceptor(const RefundAcceptorRequest& req) {
  return ObserveRpc("SwapCoordinatorService.RefundAcceptor", &req.id(), [&] {
    RequireId(req.id(), "refund acceptor");
    RefundAcceptorResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->RefundAcceptor(req.id()));
    return resp;
  });
}

CancelOfferResponse SwapService::CancelOffer(const CancelOfferRequest& req) {
  return ObserveRpc("SwapCoordinatorService.CancelOffer", &req.id(), [&] {
    RequireId(req.id(), "cancel offer");
    CancelOfferResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->CancelOffer(req.id()));
    return resp;
  });
}

GetOfferResponse SwapService::GetOffer(const GetOfferRequest& req) {
  return ObserveRpc("SwapCoordinatorService.GetOffer", &req.id(), [&] {
    RequireId(req.id(), "get offer");
    GetOfferResponse resp;
    *resp.mutable_offer() = ToProto(ctx_.coordinator->GetSwap(req.id()));
    return resp;
  });
}

ListOffersResponse SwapService::ListOffers(const ListOffersRequest& req) {
  return ObserveRpc("SwapCoordinatorService.ListOffers", nullptr, [&] {
    ListOffersResponse resp;
    for (const auto& swap : ctx_.coordinator->ListSwaps(FilterFrom(req))) {
      *resp.add_offers() = ToProto(swap);
    }
    return resp;
  });
}

GetBalancesResponse SwapService::GetBalances(const GetBalancesRequest&) {
  return ObserveRpc("SwapCoordinatorService.GetBalances", nullptr, [&] {
    GetBalancesResponse resp;
    for (const auto& [asset, amount] : ctx_.coordinator->Balances()) {
      auto* balance = resp.add_balances();
      balance->set_asset(asset);
      balance->set_amount(amount.ToString());
    }
    return resp;
  });
}

} // namespace atomicswap::service
