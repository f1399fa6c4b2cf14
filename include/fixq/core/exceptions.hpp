#ifndef FIXQ_CORE_EXCEPTIONS_HPP
#define FIXQ_CORE_EXCEPTIONS_HPP

#include <concepts>
#include <stdexcept>
#include <string>

namespace fixq {

// Every way a conversion can fail. Ok is only ever seen through the
// ReturnStatus policy; the throwing API never produces it.
enum class Status {
  Ok,
  InvalidSpec,          // integer_bits + fractional_bits outside [1, 53]
  InvalidRoundingMode,  // unknown rounding code
  InvalidOverflowMode,  // unknown overflow code
  Overflow,             // out of range under OverflowMode::Error
  UnsupportedInputType, // not a finite real scalar or array of reals
};

inline const char *statusName(Status S) {
  switch (S) {
  case Status::Ok:                   return "Ok";
  case Status::InvalidSpec:          return "InvalidSpec";
  case Status::InvalidRoundingMode:  return "InvalidRoundingMode";
  case Status::InvalidOverflowMode:  return "InvalidOverflowMode";
  case Status::Overflow:             return "Overflow";
  case Status::UnsupportedInputType: return "UnsupportedInputType";
  }
  return "???";
}

// ===================================================================
// Error hierarchy
// ===================================================================
// One class per failing Status so callers can catch exactly the
// condition they care about, or catch Error and switch on status().

class Error : public std::runtime_error {
public:
  Error(Status S, const std::string &Message)
      : std::runtime_error(Message), Code(S) {}

  Status status() const noexcept { return Code; }

private:
  Status Code;
};

class InvalidSpecError : public Error {
public:
  explicit InvalidSpecError(const std::string &Message)
      : Error(Status::InvalidSpec, Message) {}
};

class InvalidRoundingModeError : public Error {
public:
  explicit InvalidRoundingModeError(const std::string &Message)
      : Error(Status::InvalidRoundingMode, Message) {}
};

class InvalidOverflowModeError : public Error {
public:
  explicit InvalidOverflowModeError(const std::string &Message)
      : Error(Status::InvalidOverflowMode, Message) {}
};

class OverflowError : public Error {
public:
  explicit OverflowError(const std::string &Message)
      : Error(Status::Overflow, Message) {}
};

class UnsupportedInputTypeError : public Error {
public:
  explicit UnsupportedInputTypeError(const std::string &Message)
      : Error(Status::UnsupportedInputType, Message) {}
};

// ===================================================================
// Exception policies
// ===================================================================

template <typename E>
concept ExceptionPolicy = requires {
  { E::throws } -> std::convertible_to<bool>;
};

// Result of an operation under ReturnStatus. Value is value-initialized
// whenever Code != Status::Ok.
template <typename T> struct Outcome {
  T Value{};
  Status Code = Status::Ok;

  bool ok() const { return Code == Status::Ok; }
};

namespace exceptions {

// Throw the typed Error subclass on the first failure.
struct Throw {
  static constexpr bool throws = true;
};

// Return {result, status} from every operation.
struct ReturnStatus {
  static constexpr bool throws = false;
};

using Default = Throw;

static_assert(ExceptionPolicy<Throw>);
static_assert(ExceptionPolicy<ReturnStatus>);

} // namespace exceptions
} // namespace fixq

#endif // FIXQ_CORE_EXCEPTIONS_HPP
