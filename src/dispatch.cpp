#include "dispatch.hpp"
#include <stdexcept>

static CommandError run_native(IByteSink& sink, INativeTerminal& native, const Command& cmd) {
  return cmd.perform_native(native, FallbackWriter(sink));
}

CommandError handle_command(IByteSink& sink, const Command& cmd) {
  if (cmd.supported_on_current_target()) return write_ansi_code(sink, cmd.render());
  return run_native(sink, native_terminal(), cmd);
}

CommandError handle_command(IByteSink& sink, INativeTerminal& native, const Command& cmd) {
  if (cmd.supported_on_current_target()) return write_ansi_code(sink, cmd.render());
  return run_native(sink, native, cmd);
}

CommandError flush_sink(IByteSink& sink) {
  if (auto ec = sink.flush()) return CommandError::flush(ec, "flush failed");
  return {};
}

static const Command& checked(const Command* cmd) {
  if (!cmd) throw std::invalid_argument("null command in sequence");
  return *cmd;
}

CommandError queue_all(IByteSink& sink, std::span<const Command* const> cmds) {
  for (const Command* cmd : cmds) {
    if (auto err = handle_command(sink, checked(cmd))) return err;
  }
  return {};
}

CommandError queue_all(IByteSink& sink, INativeTerminal& native, std::span<const Command* const> cmds) {
  for (const Command* cmd : cmds) {
    if (auto err = handle_command(sink, native, checked(cmd))) return err;
  }
  return {};
}

CommandError execute_all(IByteSink& sink, std::span<const Command* const> cmds) {
  if (auto err = queue_all(sink, cmds)) return err;
  return flush_sink(sink);
}

CommandError execute_all(IByteSink& sink, INativeTerminal& native, std::span<const Command* const> cmds) {
  if (auto err = queue_all(sink, native, cmds)) return err;
  return flush_sink(sink);
}
