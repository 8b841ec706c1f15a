#pragma once
/*
 * Dispatch (queue / execute)
 *
 * Purpose: apply commands, in argument order, to a byte sink.
 *   queue:   per command, write render() if supported, else perform_native();
 *            stop at the first error; never flush.
 *   execute: queue, then flush once, only if every command succeeded.
 * Native: without an explicit INativeTerminal, native_terminal() is resolved
 *         lazily, only when a command actually needs the native path.
 * Note: native calls apply immediately, so on legacy targets queue == execute
 *       for those commands. Bytes written before a failure stay in the sink.
 */
#include <span>
#include "command.hpp"

CommandError handle_command(IByteSink& sink, const Command& cmd);
CommandError handle_command(IByteSink& sink, INativeTerminal& native, const Command& cmd);

// Flush failure as a Flush-origin CommandError.
CommandError flush_sink(IByteSink& sink);

// Sequence forms; entries must be non-null (std::invalid_argument otherwise).
CommandError queue_all(IByteSink& sink, std::span<const Command* const> cmds);
CommandError queue_all(IByteSink& sink, INativeTerminal& native, std::span<const Command* const> cmds);
CommandError execute_all(IByteSink& sink, std::span<const Command* const> cmds);
CommandError execute_all(IByteSink& sink, INativeTerminal& native, std::span<const Command* const> cmds);

template <CommandType... Cmds>
CommandError queue(IByteSink& sink, const Cmds&... cmds) {
  CommandError err;
  (void)(!(err = handle_command(sink, cmds)) && ...);
  return err;
}

template <CommandType... Cmds>
CommandError queue(IByteSink& sink, INativeTerminal& native, const Cmds&... cmds) {
  CommandError err;
  (void)(!(err = handle_command(sink, native, cmds)) && ...);
  return err;
}

template <CommandType... Cmds>
CommandError execute(IByteSink& sink, const Cmds&... cmds) {
  if (auto err = queue(sink, cmds...)) return err;
  return flush_sink(sink);
}

template <CommandType... Cmds>
CommandError execute(IByteSink& sink, INativeTerminal& native, const Cmds&... cmds) {
  if (auto err = queue(sink, native, cmds...)) return err;
  return flush_sink(sink);
}
