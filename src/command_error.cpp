#include "command_error.hpp"
#include <utility>

CommandError::CommandError(Origin origin, std::error_code ec, std::string msg)
  : origin_(origin), cause_(ec), msg_(std::move(msg)) {}

CommandError CommandError::write(std::error_code ec, std::string msg) {
  return CommandError(Origin::Write, ec, std::move(msg));
}

CommandError CommandError::flush(std::error_code ec, std::string msg) {
  return CommandError(Origin::Flush, ec, std::move(msg));
}

CommandError CommandError::native(std::error_code ec, std::string msg) {
  return CommandError(Origin::Native, ec, std::move(msg));
}

std::string CommandError::describe() const {
  if (origin_ == Origin::None) return "ok";
  std::string s = std::string(origin_name(origin_)) + ": " + msg_;
  if (cause_) s += " (" + cause_.message() + ")";
  return s;
}

const char* origin_name(CommandError::Origin origin) {
  switch (origin) {
    case CommandError::Origin::None:   return "none";
    case CommandError::Origin::Write:  return "write";
    case CommandError::Origin::Flush:  return "flush";
    case CommandError::Origin::Native: return "native";
  }
  return "unknown";
}
