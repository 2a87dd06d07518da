#ifndef IDCHECK_INVALID_INPUT_ERROR_H_
#define IDCHECK_INVALID_INPUT_ERROR_H_

#include <cstdint>
#include <stdexcept>
#include <string>

// Thrown whenever a value can not be represented as a 9-digit
// identification number.
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(int64_t value)
      : std::invalid_argument(BuildMessage(value)), value_(value) {}

  InvalidInputError(int64_t value, const std::string& message)
      : std::invalid_argument(message), value_(value) {}

  int64_t value() const { return value_; }

 private:
  static std::string BuildMessage(int64_t value) {
    return "Invalid ID number " + std::to_string(value) +
           ". Please provide a 9-digit number between 100000000 and "
           "999999999.";
  }

  int64_t value_;
};

#endif  // IDCHECK_INVALID_INPUT_ERROR_H_
