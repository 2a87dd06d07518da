#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

#include "IDIterator.hpp"
#include "IDSequence.hpp"
#include "IDUtil.hpp"
#include "InvalidInputError.hpp"

// Number of ids printed per session.
const size_t kCount = 10;

int main(int argc, char** argv) {
  std::string input;
  std::cout << "Enter ID: ";
  if (!std::getline(std::cin, input)) {
    return 1;
  }

  int64_t start_id;
  if (!IDUtil::ParseID(input, &start_id)) {
    std::cout << "Invalid ID number. Please enter a 9-digit number greater "
              << "than or equal to 100000000." << std::endl;
    return 1;
  }

  std::string choice;
  std::cout << "Enter 'it' for iterator or 'gen' for generator: ";
  if (!std::getline(std::cin, choice)) {
    return 1;
  }

  std::vector<int64_t> new_ids;
  try {
    if (choice == "it") {
      IDIterator iterator(start_id);
      int64_t id;
      while (new_ids.size() < kCount && iterator.Advance(&id)) {
        new_ids.push_back(id);
      }
    } else if (choice == "gen") {
      IDSequence sequence(start_id);
      for (int64_t id : sequence) {
        new_ids.push_back(id);
        if (new_ids.size() == kCount) break;
      }
    } else {
      std::cout << "Invalid choice. Please enter 'it' or 'gen'." << std::endl;
      return 1;
    }
  } catch (const InvalidInputError& e) {
    std::cout << e.what() << std::endl;
    return 1;
  }

  for (int64_t id : new_ids) {
    std::cout << IDUtil::ToString(id) << std::endl;
  }

  return 0;
}
