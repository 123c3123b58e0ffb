#pragma once
#include <string>

namespace sg {

// Error value handed back to request handlers. `expose` marks messages that
// are safe to show to the client (4xx).
struct HttpError {
  int status = 500;
  std::string message;
  bool expose = false;
};

// Empty message -> standard reason phrase for `status`.
HttpError make_http_error(int status, std::string message = {});

}
