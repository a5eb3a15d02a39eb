#include "wtm/error.hpp"

namespace wtm {

std::string_view kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "invalid input";
  case ErrorKind::AlreadyExists:
    return "already exists";
  case ErrorKind::NotFound:
    return "not found";
  case ErrorKind::AllocationExhausted:
    return "allocation exhausted";
  case ErrorKind::UnsafeLocation:
    return "unsafe location";
  case ErrorKind::CreationFailed:
    return "creation failed";
  case ErrorKind::DeletionFailed:
    return "deletion failed";
  case ErrorKind::MissingDependency:
    return "missing dependency";
  case ErrorKind::Io:
    return "i/o error";
  }
  return "error";
}

} // namespace wtm
