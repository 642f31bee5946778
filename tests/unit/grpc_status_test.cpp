#include <cassert>
#include <iostream>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

using releasectl::grpc::ToStatus;

void TestBackendErrorsMapToDistinctCodes() {
  assert(ToStatus(releasectl::util::NotFound("release a/r1 not found")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(releasectl::util::AlreadyExists("release a/r1 exists")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(releasectl::util::Conflict("stale resource version")).error_code() == ::grpc::StatusCode::ABORTED);
}

void TestControllerErrorsMapToCallerFacingCodes() {
  assert(ToStatus(releasectl::util::KeyDecodeError("bad::key")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(releasectl::util::LookupError("cache unavailable")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(releasectl::util::ConvergenceError("apply failed")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestUnknownErrorsAreInternalAndKeepMessage() {
  const auto status = ToStatus(std::runtime_error("boom"));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "boom");
}

} // namespace

int main() {
  TestBackendErrorsMapToDistinctCodes();
  TestControllerErrorsMapToCallerFacingCodes();
  TestUnknownErrorsAreInternalAndKeepMessage();

  std::cout << "releasectl_unit_grpc_status: pass\n";
  return 0;
}
