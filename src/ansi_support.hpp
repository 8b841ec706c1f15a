#pragma once
/*
 * AnsiSupport
 *
 * Purpose: decide once per process whether escape sequences reach a terminal that
 *          understands them; commands consult this when choosing their path.
 * Config: TERMCMD_ANSI_MODE (config.hpp) as default, TERMCMD_ANSI env as override.
 */
#include <optional>
#include <string_view>

enum class AnsiMode { Auto, Always, Never };

// Accepts auto|yes|always|no|never, case-insensitive.
std::optional<AnsiMode> parse_ansi_mode(std::string_view s);

AnsiMode default_ansi_mode();

// Auto: usable unless TERM is "dumb"; a missing TERM counts as usable.
bool detect_ansi_support(AnsiMode mode, const char* term);

// Cached for the process lifetime.
bool ansi_supported();
