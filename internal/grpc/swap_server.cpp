#include "swap_server.hpp"

#include "grpc_error.hpp"

namespace atomicswap::grpc {

using namespace atomicswap::coordinator::v1;

SwapServer::SwapServer(std::shared_ptr<atomicswap::service::SwapService> svc) : service_(std::move(svc)) {
}

::grpc::Status SwapServer::CreateOffer(::grpc::ServerContext*, const CreateOfferRequest* req, CreateOfferResponse* resp) {
  try {
    *resp = service_->CreateOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::AcceptOffer(::grpc::ServerContext*, const AcceptOfferRequest* req, AcceptOfferResponse* resp) {
  try {
    *resp = service_->AcceptOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::LockInitiatorFunds(::grpc::ServerContext*, const LockInitiatorFundsRequest* req, LockInitiatorFundsResponse* resp) {
  try {
    *resp = service_->LockInitiatorFunds(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::LockAcceptorFunds(::grpc::ServerContext*, const LockAcceptorFundsRequest* req, LockAcceptorFundsResponse* resp) {
  try {
    *resp = service_->LockAcceptorFunds(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::ClaimInitiator(::grpc::ServerContext*, const ClaimInitiatorRequest* req, ClaimInitiatorResponse* resp) {
  try {
    *resp = service_->ClaimInitiator(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::ClaimAcceptor(::grpc::ServerContext*, const ClaimAcceptorRequest* req, ClaimAcceptorResponse* resp) {
  try {
    *resp = service_->ClaimAcceptor(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::RefundInitiator(::grpc::ServerContext*, const RefundInitiatorRequest* req, RefundInitiatorResponse* resp) {
  try {
    *resp = service_->RefundInitiator(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::RefundAcceptor(::grpc::ServerContext*, const RefundAcceptorRequest* req, RefundAcceptorResponse* resp) {
  try {
    *resp = service_->RefundAcceptor(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::CancelOffer(::grpc::ServerContext*, const CancelOfferRequest* req, CancelOfferResponse* resp) {
  try {
    *resp = service_->CancelOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::GetOffer(::grpc::ServerContext*, const GetOfferRequest* req, GetOfferResponse* resp) {
  try {
    *resp = service_->GetOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::ListOffers(::grpc::ServerContext*, const ListOffersRequest* req, ListOffersResponse* resp) {
  try {
    *resp = service_->ListOffers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SwapServer::GetBalances(::grpc::ServerContext*, const GetBalancesRequest* req, GetBalancesResponse* resp) {
  try {
    *resp = service_->GetBalances(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace atomicswap::grpc
