#pragma once

#include <utility>
#include <variant>

#include "core/api_error.hpp"

namespace core::api {

// Either the decoded payload of a call or the ApiError that ended it.
template <typename T>
class RequestOutcome {
 public:
  static RequestOutcome Success(T payload) {
    return RequestOutcome(std::variant<T, ApiError>(std::in_place_index<0>, std::move(payload)));
  }

  static RequestOutcome Failure(ApiError error) {
    return RequestOutcome(std::variant<T, ApiError>(std::in_place_index<1>, std::move(error)));
  }

  bool Ok() const { return state_.index() == 0; }
  explicit operator bool() const { return Ok(); }

  // Throws std::bad_variant_access when called on the wrong alternative.
  const T& Value() const { return std::get<0>(state_); }
  T& Value() { return std::get<0>(state_); }
  const ApiError& Error() const { return std::get<1>(state_); }

 private:
  explicit RequestOutcome(std::variant<T, ApiError> state) : state_(std::move(state)) {}

  std::variant<T, ApiError> state_;
};

}  // namespace core::api
