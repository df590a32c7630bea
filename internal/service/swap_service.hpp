#pragma once

#include "atomicswap/coordinator/v1.hpp"
#include "service_context.hpp"

namespace atomicswap::service {

class SwapService {
 public:
  explicit SwapService(ServiceContext ctx);

  atomicswap::coordinator::v1::CreateOfferResponse CreateOffer(const atomicswap::coordinator::v1::CreateOfferRequest& req);
  atomicswap::coordinator::v1::AcceptOfferResponse AcceptOffer(const atomicswap::coordinator::v1::AcceptOfferRequest& req);

  atomicswap::coordinator::v1::LockInitiatorFundsResponse LockInitiatorFunds(const atomicswap::coordinator::v1::LockInitiatorFundsRequest& req);
  atomicswap::coordinator::v1::LockAcceptorFundsResponse  LockAcceptorFunds(const atomicswap::coordinator::v1::LockAcceptorFundsRequest& req);

  atomicswap::coordinator::v1::ClaimInitiatorResponse ClaimInitiator(const atomicswap::coordinator::v1::ClaimInitiatorRequest& req);
  atomicswap::coordinator::v1::ClaimAcceptorResponse  ClaimAcceptor(const atomicswap::coordinator::v1::ClaimAcceptorRequest& req);

  atomicswap::coordinator::v1::RefundInitiatorResponse RefundInitiator(const atomicswap::coordinator::v1::RefundInitiatorRequest& req);
  atomicswap::coordinator::v1::RefundAcceptorResponse  RefundAcceptor(const atomicswap::coordinator::v1::RefundAcceptorRequest& req);

  atomicswap::coordinator::v1::CancelOfferResponse CancelOffer(const atomicswap::coordinator::v1::CancelOfferRequest& req);

  atomicswap::coordinator::v1::GetOfferResponse    GetOffer(const atomicswap::coordinator::v1::GetOfferRequest& req);
  atomicswap::coordinator::v1::ListOffersResponse  ListOffers(const atomicswap::coordinator::v1::ListOffersRequest& req);
  atomicswap::coordinator::v1::GetBalancesResponse GetBalances(const atomicswap::coordinator::v1::GetBalancesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace atomicswap::service
