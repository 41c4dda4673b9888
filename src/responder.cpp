#include "lindos/responder.hpp"

namespace lindos {

std::string EchoResponder::respond(std::string_view message, std::string* error) const {
  if (message.size() > max_message_bytes_) {
    if (error) *error = "message too long";
    return {};
  }
  std::string out;
  out.reserve(10 + message.size());
  out += "You said: ";
  out += message;
  return out;
}

}  // namespace lindos
