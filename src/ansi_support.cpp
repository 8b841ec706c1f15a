#include "ansi_support.hpp"
#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

static std::string to_lower(std::string_view s) {
  std::string r(s);
  for (char& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return r;
}

std::optional<AnsiMode> parse_ansi_mode(std::string_view s) {
  std::string v = to_lower(s);
  if (v == "auto") return AnsiMode::Auto;
  if (v == "yes" || v == "always") return AnsiMode::Always;
  if (v == "no" || v == "never") return AnsiMode::Never;
  return std::nullopt;
}

AnsiMode default_ansi_mode() {
#if TERMCMD_ANSI_MODE == TERMCMD_ANSI_ALWAYS
  return AnsiMode::Always;
#elif TERMCMD_ANSI_MODE == TERMCMD_ANSI_NEVER
  return AnsiMode::Never;
#else
  return AnsiMode::Auto;
#endif
}

bool detect_ansi_support(AnsiMode mode, const char* term) {
  switch (mode) {
    case AnsiMode::Always: return true;
    case AnsiMode::Never: return false;
    case AnsiMode::Auto: break;
  }
  if (term == nullptr || *term == '\0') return true;
  return to_lower(term) != "dumb";
}

static AnsiMode mode_from_env() {
  const char* value = std::getenv(TERMCMD_ANSI_ENV);
  if (value == nullptr) return default_ansi_mode();
  if (auto mode = parse_ansi_mode(value)) return *mode;
  std::cerr << "[termcmd] invalid " TERMCMD_ANSI_ENV " value '" << value
            << "', defaulting to " TERMCMD_ANSI_MODE_NAME << std::endl;
  return default_ansi_mode();
}

bool ansi_supported() {
  static const bool supported = detect_ansi_support(mode_from_env(), std::getenv("TERM"));
  return supported;
}
