#pragma once
/*
 * Command
 *
 * Purpose: one terminal capability request, dispatchable two ways:
 *   - render(): escape-sequence form written to the sink;
 *   - perform_native(): synchronous native call, used only when
 *     supported_on_current_target() is false.
 * Invariant: both paths leave the terminal in the same state.
 * Lifetime: built right before queue/execute, stateless, disposable.
 */
#include <concepts>
#include <ostream>
#include <string>
#include <string_view>
#include "byte_sink.hpp"
#include "command_error.hpp"
#include "native_terminal.hpp"

#define TERMCMD_CSI "\x1B["

// Byte channel handed to perform_native. Writes go out immediately (write + flush)
// since the native path has no queuing; a default-constructed writer discards.
class FallbackWriter {
public:
  FallbackWriter() = default;
  explicit FallbackWriter(IByteSink& sink) : sink_(&sink) {}
  CommandError write(std::string_view bytes) const;
  bool discards() const { return sink_ == nullptr; }
private:
  IByteSink* sink_ = nullptr;
};

class Command {
public:
  virtual ~Command() = default;
  virtual std::string render() const = 0;
  virtual bool supported_on_current_target() const;
  // Default: no native equivalent, reports std::errc::not_supported.
  virtual CommandError perform_native(INativeTerminal& native, const FallbackWriter& writer) const;
};

template <typename T>
concept CommandType = std::derived_from<T, Command>;

// Maps a sink write failure to a Write-origin CommandError.
CommandError write_ansi_code(IByteSink& sink, std::string_view code);

// Escape targets get render(); legacy targets run the native call with a
// discarding writer and set failbit if it fails.
std::ostream& format_command(std::ostream& os, const Command& cmd, INativeTerminal& native);

// format_command against the process native terminal, resolved only when needed.
std::ostream& operator<<(std::ostream& os, const Command& cmd);
