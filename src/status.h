#ifndef SANDBOXD_STATUS_H
#define SANDBOXD_STATUS_H

#include <boost/system/error_code.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>

namespace sandboxd {

// Stable error kinds surfaced to callers.
enum class errc {
  validation = 1,
  capacity,
  not_found,
  timeout,
  output_limit,
  runtime,
  infrastructure,
};

}

namespace boost {
namespace system {

template <>
struct is_error_code_enum<sandboxd::errc> : std::true_type {};

}
}

namespace sandboxd {

const boost::system::error_category& error_category();

boost::system::error_code make_error_code(errc e);

// Name of the kind as it appears on the wire, e.g. "TimeoutError".
const char* ErrorKindName(const boost::system::error_code& code);

class Status {
 public:
  Status() = default;
  Status(errc kind, std::string reason)
      : code_(make_error_code(kind)), reason_(std::move(reason)) {}
  Status(boost::system::error_code code, std::string reason)
      : code_(code), reason_(std::move(reason)) {}

  bool ok() const { return !code_; }
  bool Is(errc kind) const { return code_ == make_error_code(kind); }
  const boost::system::error_code& code() const { return code_; }
  const std::string& reason() const { return reason_; }
  std::string ToString() const;

 private:
  boost::system::error_code code_;
  std::string reason_;
};

std::ostream& operator<<(std::ostream& out, const Status& status);

using StatusHandler = std::function<void(const Status&)>;

template <typename Result>
using ResultHandler = std::function<void(const Status&, Result)>;

}

#endif //SANDBOXD_STATUS_H
