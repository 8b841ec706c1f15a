#pragma once
/*
 * CommandError
 *
 * Purpose: single error kind for command dispatch (sink write, sink flush, native call).
 * Usage: default-constructed == success; `if (auto err = execute(...))` on failure.
 * Note: origin tells write/flush/native apart, cause() keeps the underlying error_code.
 */
#include <string>
#include <system_error>

class CommandError {
public:
  enum class Origin { None, Write, Flush, Native };

  CommandError() = default;

  static CommandError write(std::error_code ec, std::string msg);
  static CommandError flush(std::error_code ec, std::string msg);
  static CommandError native(std::error_code ec, std::string msg);

  explicit operator bool() const { return origin_ != Origin::None; }
  Origin origin() const { return origin_; }
  const std::error_code& cause() const { return cause_; }
  const std::string& message() const { return msg_; }
  std::string describe() const;

private:
  CommandError(Origin origin, std::error_code ec, std::string msg);

  Origin origin_ = Origin::None;
  std::error_code cause_;
  std::string msg_;
};

const char* origin_name(CommandError::Origin origin);
