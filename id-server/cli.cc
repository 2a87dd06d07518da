#include <iostream>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <functional>

#include "IDServiceClient.hpp"
#include "IDUtil.hpp"
#include "InvalidInputError.hpp"

using namespace std::chrono;

void PrintUsage() {
  std::cerr << "Usage: ./id-cli server_address validate|next [quiet|time]" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc < 3 || argc > 4) {
    PrintUsage();
    exit(1);
  }

  // Find target, action from args.
  std::string target(argv[1]);
  std::string action(argv[2]);

  // Sort out quiet arg.
  bool quiet = false, time = false;
  if (argc == 4) {
    if (strcmp(argv[3], "quiet") == 0) {
      quiet = true;
    } else if (strcmp(argv[3], "time") == 0) {
      time = true;
    } else {
      PrintUsage();
      exit(1);
    }
  }

  // Init service client.
  auto id_service_client = IDServiceClient::New(target);

  // One lambda per action.
  auto validate_fn = [&] (int64_t id) -> void {
    bool result = id_service_client->Validate(id);
    if (quiet) return;
    std::cout << (result ? "true" : "false") << std::endl;
  };
  auto next_fn = [&] (int64_t id) -> void {
    std::vector<int64_t> ids;
    bool exhausted = id_service_client->Next(id, 10, false, &ids);
    if (quiet) return;
    std::cout << IDServiceClient::FormatIds(ids, exhausted) << std::endl;
  };

  // Choose the lambda based on action arg.
  std::function<void(int64_t id)> f;
  if (action == "validate") {
    f = validate_fn;
  } else if (action == "next") {
    f = next_fn;
  } else {
    std::cerr << "Unknown action \"" << action << "\"." << std::endl;
    PrintUsage();
    exit(1);
  }

  // Read all lines, execute action.
  std::ios::sync_with_stdio(false);
  std::string line;

  int line_count = 0;
  auto start = high_resolution_clock::now();
  while (std::getline(std::cin, line)) {
    ++line_count;
    int64_t id;
    if (!IDUtil::ParseID(line, &id)) {
      if (!quiet) {
        std::cout << "invalid: \"" << line << "\" is not a 9-digit ID number." << std::endl;
      }
      continue;
    }
    try {
      f(id);
    } catch (const InvalidInputError& e) {
      if (!quiet) std::cout << "invalid: " << e.what() << std::endl;
    }
  }
  if (line_count == 0) return 1;
  auto stop = high_resolution_clock::now();
  auto duration_ms = duration_cast<milliseconds>(stop - start);
  auto duration_s = duration_cast<seconds>(stop - start);
  if (time) {
    std::cout << "Took " << duration_ms.count() << "ms." << std::endl;
    if (duration_s.count() > 0) {
      int qps = line_count / duration_s.count();
      std::cout << "QPS: " << qps << std::endl;
    }
    std::cout << "Average request duration: " << duration_ms.count() / line_count << "ms." << std::endl;
  }

  return 0;
}
