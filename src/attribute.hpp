#pragma once
/*
 * Attribute
 *
 * Purpose: text rendering attributes and their coupled (kind, bit, SGR, name) table.
 * Rule: declaration order == table order == ascending bit position.
 * Note: every bit lookup goes through the table; an unknown value throws.
 */
#include <cstdint>
#include <span>
#include <string_view>

enum class Attribute : unsigned char {
  Reset,
  Bold,
  Dim,
  Italic,
  Underlined,
  SlowBlink,
  RapidBlink,
  Reverse,
  Hidden,
  CrossedOut,
  Fraktur,
  NoBold,
  NormalIntensity,
  NoItalic,
  NoUnderline,
  NoBlink,
  NoReverse,
  NoHidden,
  NotCrossedOut,
  Framed,
  Encircled,
  OverLined,
  NotFramedOrEncircled,
  NotOverLined,
};

struct AttributeInfo {
  Attribute kind;
  unsigned bit;
  unsigned char sgr;
  std::string_view name;
};

std::span<const AttributeInfo> attribute_table();

// Throws std::out_of_range for values outside the table.
const AttributeInfo& attribute_info(Attribute a);

std::uint32_t attribute_bit(Attribute a);
unsigned char sgr_code(Attribute a);
std::string_view attribute_name(Attribute a);
