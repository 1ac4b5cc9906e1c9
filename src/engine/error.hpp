#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace fey::engine {

enum class ErrorCode {
  InvalidSpec,
  UnknownPerformer,
  ConnectionCycle,
  PerformerCreationFailed,
  LoadError,
  WorkerFailure,
  RestartRequired,
  Internal,
};

struct EngineError {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message)};
}

inline auto make_error(std::string message) -> EngineError {
  return EngineError{ErrorCode::Internal, std::move(message)};
}

constexpr auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::InvalidSpec:
      return "InvalidSpec";
    case ErrorCode::UnknownPerformer:
      return "UnknownPerformer";
    case ErrorCode::ConnectionCycle:
      return "ConnectionCycle";
    case ErrorCode::PerformerCreationFailed:
      return "PerformerCreationFailed";
    case ErrorCode::LoadError:
      return "LoadError";
    case ErrorCode::WorkerFailure:
      return "WorkerFailure";
    case ErrorCode::RestartRequired:
      return "RestartRequired";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Unknown";
}

}  // namespace fey::engine
