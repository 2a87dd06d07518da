#ifndef IDCHECK_ID_SERVICE_CLIENT_H_
#define IDCHECK_ID_SERVICE_CLIENT_H_

#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "idcheck.grpc.pb.h"

#include "IDUtil.hpp"
#include "InvalidInputError.hpp"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;
using grpc::StatusCode;

using idcheck::IDService;
using idcheck::ValidateRequest;
using idcheck::ValidateResponse;
using idcheck::NextRequest;
using idcheck::NextResponse;

class IDServiceClient {
 public:
  bool Validate(int64_t id) {
    ValidateRequest request;
    request.set_id(id);
    ValidateResponse response;
    ClientContext context;
    Status status = stub_->Validate(&context, request, &response);
    CheckStatus(status, id);
    return response.valid();
  }

  // Fetches up to count valid ids at or after start. Returns true when the
  // server reported the end of the id space.
  bool Next(int64_t start, uint32_t count, bool generator, std::vector<int64_t>* ids) {
    NextRequest request;
    request.set_start(start);
    request.set_count(count);
    request.set_mode(generator ? NextRequest::GENERATOR : NextRequest::ITERATOR);
    NextResponse response;
    ClientContext context;
    Status status = stub_->Next(&context, request, &response);
    CheckStatus(status, start);
    ids->assign(response.ids().begin(), response.ids().end());
    return response.exhausted();
  }

  // One line of space separated ids. A short read ends with "(end)".
  static std::string FormatIds(const std::vector<int64_t>& ids, bool exhausted) {
    std::string line;
    for (int64_t id : ids) {
      if (!line.empty()) line += " ";
      line += IDUtil::ToString(id);
    }
    if (exhausted) {
      if (!line.empty()) line += " ";
      line += "(end)";
    }
    return line;
  }

  static std::unique_ptr<IDServiceClient> New(const std::string& target) {
    auto insecure_credentials = grpc::InsecureChannelCredentials();
    auto grpc_channel = grpc::CreateChannel(target, insecure_credentials);
    return std::unique_ptr<IDServiceClient>(new IDServiceClient(grpc_channel));
  }

 private:
  IDServiceClient(std::shared_ptr<Channel> channel)
      : stub_(IDService::NewStub(channel)) {}

  // Bad input is the caller's problem, anything else is fatal.
  static void CheckStatus(const Status& status, int64_t value) {
    if (status.ok()) return;
    if (status.error_code() == StatusCode::INVALID_ARGUMENT) {
      throw InvalidInputError(value, status.error_message());
    }
    std::cerr << status.error_code() << ": " << status.error_message() << std::endl;
    exit(1);
  }

  std::unique_ptr<IDService::Stub> stub_;
};

#endif  // IDCHECK_ID_SERVICE_CLIENT_H_
