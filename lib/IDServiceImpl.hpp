#ifndef IDCHECK_ID_SERVICE_IMPL_H_
#define IDCHECK_ID_SERVICE_IMPL_H_

#include <cstdint>
#include <iostream>
#include <mutex>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "idcheck.grpc.pb.h"

#include "IDIterator.hpp"
#include "IDSequence.hpp"
#include "IDUtil.hpp"
#include "InvalidInputError.hpp"

using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

using idcheck::IDService;
using idcheck::ValidateRequest;
using idcheck::ValidateResponse;
using idcheck::NextRequest;
using idcheck::NextResponse;

class IDServiceImpl final : public IDService::Service {
 public:
  static const uint32_t kDefaultCount = 10;
  static const uint32_t kMaxCount = 1000;

  explicit IDServiceImpl(bool verbose = true) : verbose_(verbose) {}

  Status Validate(ServerContext* context, const ValidateRequest* request, ValidateResponse* response) override {
    Log("Validate", request->id());
    try {
      response->set_valid(IDUtil::IsValid(request->id()));
    } catch (const InvalidInputError& e) {
      return Status(StatusCode::INVALID_ARGUMENT, e.what());
    }
    return Status::OK;
  }

  Status Next(ServerContext* context, const NextRequest* request, NextResponse* response) override {
    Log("Next", request->start());
    uint32_t count = request->count();
    if (count == 0) {
      count = kDefaultCount;
    } else if (count > kMaxCount) {
      count = kMaxCount;
    }

    // Every request walks its own cursor, nothing is shared between calls.
    try {
      if (request->mode() == NextRequest::GENERATOR) {
        IDSequence sequence(request->start());
        for (int64_t id : sequence.Take(count)) {
          response->add_ids(id);
        }
      } else {
        IDIterator iterator(request->start());
        int64_t id;
        while ((uint32_t) response->ids_size() < count && iterator.Advance(&id)) {
          response->add_ids(id);
        }
      }
    } catch (const InvalidInputError& e) {
      return Status(StatusCode::INVALID_ARGUMENT, e.what());
    }
    response->set_exhausted((uint32_t) response->ids_size() < count);
    return Status::OK;
  }

 private:
  void Log(const char* method, int64_t id) {
    if (!verbose_) return;
    cout_mutex_.lock();
    std::cout << method << " " << id << std::endl;
    cout_mutex_.unlock();
  }

  bool verbose_;
  std::mutex cout_mutex_;
};

#endif  // IDCHECK_ID_SERVICE_IMPL_H_
