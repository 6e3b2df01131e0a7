#pragma once

#include <stdexcept>
#include <string>

namespace releaselog::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport or API-level failure while talking to the cluster.
class ClusterError : public std::runtime_error {
 public:
  ClusterError(const std::string& msg, long http_status = 0) : std::runtime_error(msg), http_status_(http_status) {
  }

  long http_status() const {
    return http_status_;
  }

 private:
  long http_status_;
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace releaselog::util
