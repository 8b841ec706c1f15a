#pragma once
/*
 * Standard commands
 *
 * Purpose: concrete Command set covering text, cursor, clearing and attributes.
 * Coordinates: 0-based (row, col), unsigned 16-bit; escape forms convert to 1-based CUP.
 */
#include <cstdint>
#include <string>
#include <utility>
#include "command.hpp"
#include "attributes.hpp"
#include "types.hpp"

class Print : public Command {
public:
  explicit Print(std::string text) : text_(std::move(text)) {}
  std::string render() const override { return text_; }
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
private:
  std::string text_;
};

class MoveTo : public Command {
public:
  MoveTo(std::uint16_t col, std::uint16_t row) : col_(col), row_(row) {}
  std::string render() const override;
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
private:
  std::uint16_t col_;
  std::uint16_t row_;
};

class HideCursor : public Command {
public:
  std::string render() const override { return TERMCMD_CSI "?25l"; }
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
};

class ShowCursor : public Command {
public:
  std::string render() const override { return TERMCMD_CSI "?25h"; }
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
};

class Clear : public Command {
public:
  explicit Clear(ClearType type) : type_(type) {}
  std::string render() const override;
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
private:
  ClearType type_;
};

class SetAttribute : public Command {
public:
  explicit SetAttribute(Attribute a) : attr_(a) {}
  std::string render() const override;
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
private:
  Attribute attr_;
};

// One SGR per member, ascending bit order. Native path stops at the first failure.
class SetAttributes : public Command {
public:
  explicit SetAttributes(Attributes attrs) : attrs_(attrs) {}
  std::string render() const override;
  CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const override;
private:
  Attributes attrs_;
};
