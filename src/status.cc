#include "status.h"

namespace sandboxd {

namespace {

class ErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "sandboxd"; }

  std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
    case errc::validation:
      return "request rejected by validation";
    case errc::capacity:
      return "capacity exceeded";
    case errc::not_found:
      return "not found";
    case errc::timeout:
      return "execution timed out";
    case errc::output_limit:
      return "output limit exceeded";
    case errc::runtime:
      return "runtime failure";
    case errc::infrastructure:
      return "infrastructure unavailable";
    }
    return "unknown error";
  }
};

}

const boost::system::error_category& error_category() {
  static const ErrorCategory category;
  return category;
}

boost::system::error_code make_error_code(errc e) {
  return boost::system::error_code(static_cast<int>(e), error_category());
}

const char* ErrorKindName(const boost::system::error_code& code) {
  if (!code) {
    return "Ok";
  }
  if (code.category() != error_category()) {
    return "InfrastructureError";
  }
  switch (static_cast<errc>(code.value())) {
  case errc::validation:
    return "ValidationError";
  case errc::capacity:
    return "CapacityError";
  case errc::not_found:
    return "NotFoundError";
  case errc::timeout:
    return "TimeoutError";
  case errc::output_limit:
    return "OutputLimitError";
  case errc::runtime:
    return "RuntimeError";
  case errc::infrastructure:
    return "InfrastructureError";
  }
  return "InfrastructureError";
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string text = ErrorKindName(code_);
  text += ": ";
  text += reason_.empty() ? code_.message() : reason_;
  return text;
}

std::ostream& operator<<(std::ostream& out, const Status& status) {
  return out << status.ToString();
}

}
