#include "serve_guard/http_error.hpp"
#include <httplib.h>

namespace sg {

HttpError make_http_error(int status, std::string message) {
  HttpError e;
  e.status = status;
  e.message = message.empty() ? std::string(httplib::status_message(status))
                              : std::move(message);
  e.expose = status < 500;
  return e;
}

}
