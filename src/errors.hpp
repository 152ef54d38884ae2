#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace canopy
{

  enum class ErrorCode : uint8_t
  {
    NotFound = 0,
    CyclicMove = 1,
    InvalidOperation = 2,
    InvariantViolation = 3
  };

  inline std::string_view reasonName(ErrorCode code)
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::CyclicMove:
      return "cyclic_move";
    case ErrorCode::InvalidOperation:
      return "invalid_operation";
    case ErrorCode::InvariantViolation:
      return "invariant_violation";
    }
    return "unknown";
  }

  // Base of every structural failure; storage failures stay MdbError.
  struct HierarchyError : std::runtime_error
  {
    HierarchyError(ErrorCode c, const std::string &what) : std::runtime_error(what), code(c) {}
    ErrorCode code;
  };

  struct NotFoundError : HierarchyError
  {
    explicit NotFoundError(const std::string &what) : HierarchyError(ErrorCode::NotFound, what) {}
  };

  struct CyclicMoveError : HierarchyError
  {
    explicit CyclicMoveError(const std::string &what) : HierarchyError(ErrorCode::CyclicMove, what) {}
  };

  struct InvalidOperationError : HierarchyError
  {
    explicit InvalidOperationError(const std::string &what) : HierarchyError(ErrorCode::InvalidOperation, what) {}
  };

  struct InvariantViolationError : HierarchyError
  {
    explicit InvariantViolationError(const std::string &what) : HierarchyError(ErrorCode::InvariantViolation, what) {}
  };

} // namespace canopy
