#include <iostream>
#include <string>
#include <random>
#include <cstdlib>

#include "IDUtil.hpp"

void PrintUsage() {
  std::cout << "Usage: ./id-gen count" << std::endl;
}

int main(int argc, char** argv) {
  // Check argument count.
  if (argc != 2) {
    PrintUsage();
    exit(1);
  }

  int n = atoi(argv[1]);
  if (n < 0) {
    PrintUsage();
    exit(1);
  }

  // Draw a random 8-digit prefix without leading zero and append the check
  // digit.
  std::random_device rd;
  std::mt19937 mt(rd());
  std::uniform_int_distribution<int64_t> dist(10000000, 99999999);
  while (n--) {
    int64_t prefix = dist(mt);
    int64_t id = prefix * 10 + IDUtil::ComputeCheckDigit(prefix);
    std::cout << IDUtil::ToString(id) << std::endl;
  }

  return 0;
}
