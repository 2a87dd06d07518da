#ifndef IDCHECK_ID_UTIL_H_
#define IDCHECK_ID_UTIL_H_

#include <cctype>
#include <cstdint>
#include <string>

#include "InvalidInputError.hpp"

class IDUtil {
 public:
  static const int64_t kMinID = 100000000;
  static const int64_t kMaxID = 999999999;
  static const int kDigits = 9;

  // True when the value is a 9-digit number without leading zero.
  static bool InDomain(int64_t id) {
    return id >= kMinID && id <= kMaxID;
  }

  // Checks whether the supplied id is valid. Throws InvalidInputError if the
  // id is not a 9-digit number.
  static bool IsValid(int64_t id) {
    if (!InDomain(id)) {
      throw InvalidInputError(id);
    }

    // Walk the digits from the right. Position 9 (the last one) is odd, so
    // doubling starts with the second digit from the right.
    int checksum = 0;
    bool doubled = false;
    for (int i = 0; i < kDigits; ++i) {
      int digit = (int) (id % 10);
      id /= 10;
      checksum += doubled ? DoubledValue(digit) : digit;
      doubled = !doubled;
    }
    return checksum % 10 == 0;
  }

  // Parses a canonical id string: exactly 9 decimal digits, no leading zero.
  // Returns false and clears the output on any violation.
  static bool ParseID(const std::string& text, int64_t* id) {
    *id = 0;
    if (text.size() != kDigits) {
      return false;
    }

    int64_t value = 0;
    for (char c : text) {
      if (!isdigit((unsigned char) c)) {
        // Contains at least one non-digit character.
        return false;
      }
      value = value * 10 + (c - '0');
    }

    if (!InDomain(value)) {
      return false;
    }
    *id = value;
    return true;
  }

  // Computes the 9th digit for an 8-digit prefix so that prefix * 10 + digit
  // is a valid id.
  static int ComputeCheckDigit(int64_t prefix) {
    if (prefix < kMinID / 10 || prefix > kMaxID / 10) {
      throw InvalidInputError(
          prefix, "Invalid ID prefix " + std::to_string(prefix) +
                      ". Please provide an 8-digit number between 10000000 "
                      "and 99999999.");
    }

    // The prefix digits sit at positions 1..8; the rightmost of them is at an
    // even position and gets doubled.
    int checksum = 0;
    bool doubled = true;
    for (int i = 0; i < kDigits - 1; ++i) {
      int digit = (int) (prefix % 10);
      prefix /= 10;
      checksum += doubled ? DoubledValue(digit) : digit;
      doubled = !doubled;
    }
    return (10 - checksum % 10) % 10;
  }

  // Renders the id with exactly 9 digit positions.
  static std::string ToString(int64_t id) {
    std::string s = std::to_string(id);
    if (s.size() < kDigits) {
      s.insert(0, kDigits - s.size(), '0');
    }
    return s;
  }

 private:
  // 2 * digit with its two decimal digits summed up.
  static int DoubledValue(int digit) {
    int doubled = digit * 2;
    return doubled >= 10 ? doubled - 9 : doubled;
  }
};

#endif  // IDCHECK_ID_UTIL_H_
