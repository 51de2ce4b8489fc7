#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace forecast::grpc {

namespace {

// Field errors ride in the message: "<what>: field: message (code); ..."
std::string DescribeValidation(const util::ValidationFailed& e) {
  std::string message = e.what();
  const auto& errors  = e.Errors();
  for (std::size_t i = 0; i < errors.size(); ++i) {
    message += i == 0 ? ": " : "; ";
    message += errors[i].field + ": " + errors[i].message + " (" + errors[i].code + ")";
  }
  return message;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace forecast::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (const auto* validation = dynamic_cast<const ValidationFailed*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, DescribeValidation(*validation)};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ConfigurationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace forecast::grpc
