#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "atomicswap/coordinator/v1.hpp"
#include "internal/service/swap_service.hpp"

namespace atomicswap::grpc {

class SwapServer final : public atomicswap::coordinator::v1::SwapCoordinatorService::Service {
 public:
  explicit SwapServer(std::shared_ptr<atomicswap::service::SwapService> svc);

  ::grpc::Status CreateOffer(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::CreateOfferRequest* req,
                             atomicswap::coordinator::v1::CreateOfferResponse* resp) override;

  ::grpc::Status AcceptOffer(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::AcceptOfferRequest* req,
                             atomicswap::coordinator::v1::AcceptOfferResponse* resp) override;

  ::grpc::Status LockInitiatorFunds(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::LockInitiatorFundsRequest* req,
                                    atomicswap::coordinator::v1::LockInitiatorFundsResponse* resp) override;

  ::grpc::Status LockAcceptorFunds(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::LockAcceptorFundsRequest* req,
                                   atomicswap::coordinator::v1::LockAcceptorFundsResponse* resp) override;

  ::grpc::Status ClaimInitiator(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::ClaimInitiatorRequest* req,
                                atomicswap::coordinator::v1::ClaimInitiatorResponse* resp) override;

  ::grpc::Status ClaimAcceptor(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::ClaimAcceptorRequest* req,
                               atomicswap::coordinator::v1::ClaimAcceptorResponse* resp) override;

  ::grpc::Status RefundInitiator(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::RefundInitiatorRequest* req,
                                 atomicswap::coordinator::v1::RefundInitiatorResponse* resp) override;

  ::grpc::Status RefundAcceptor(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::RefundAcceptorRequest* req,
                                atomicswap::coordinator::v1::RefundAcceptorResponse* resp) override;

  ::grpc::Status CancelOffer(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::CancelOfferRequest* req,
                             atomicswap::coordinator::v1::CancelOfferResponse* resp) override;

  ::grpc::Status GetOffer(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::GetOfferRequest* req,
                          atomicswap::coordinator::v1::GetOfferResponse* resp) override;

  ::grpc::Status ListOffers(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::ListOffersRequest* req,
                            atomicswap::coordinator::v1::ListOffersResponse* resp) override;

  ::grpc::Status GetBalances(::grpc::ServerContext* ctx, const atomicswap::coordinator::v1::GetBalancesRequest* req,
                             atomicswap::coordinator::v1::GetBalancesResponse* resp) override;

 private:
  std::shared_ptr<atomicswap::service::SwapService> service_;
};

} // namespace atomicswap::grpc
