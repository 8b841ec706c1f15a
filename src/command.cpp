#include "command.hpp"
#include "ansi_support.hpp"

CommandError FallbackWriter::write(std::string_view bytes) const {
  if (!sink_) return {};
  if (auto ec = sink_->write(bytes)) return CommandError::write(ec, "fallback write failed");
  if (auto ec = sink_->flush()) return CommandError::flush(ec, "fallback flush failed");
  return {};
}

bool Command::supported_on_current_target() const { return ansi_supported(); }

CommandError Command::perform_native(INativeTerminal&, const FallbackWriter&) const {
  return CommandError::native(std::make_error_code(std::errc::not_supported),
                              "command has no native equivalent");
}

CommandError write_ansi_code(IByteSink& sink, std::string_view code) {
  if (auto ec = sink.write(code)) return CommandError::write(ec, "write ansi code failed");
  return {};
}

std::ostream& format_command(std::ostream& os, const Command& cmd, INativeTerminal& native) {
  if (cmd.supported_on_current_target()) return os << cmd.render();
  if (cmd.perform_native(native, FallbackWriter())) os.setstate(std::ios_base::failbit);
  return os;
}

std::ostream& operator<<(std::ostream& os, const Command& cmd) {
  if (cmd.supported_on_current_target()) return os << cmd.render();
  return format_command(os, cmd, native_terminal());
}
