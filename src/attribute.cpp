#include "attribute.hpp"
#include <array>
#include <stdexcept>
#include <string>

namespace {

constexpr std::array<AttributeInfo, 24> kTable = {{
  {Attribute::Reset,                 0,  0, "Reset"},
  {Attribute::Bold,                  1,  1, "Bold"},
  {Attribute::Dim,                   2,  2, "Dim"},
  {Attribute::Italic,                3,  3, "Italic"},
  {Attribute::Underlined,            4,  4, "Underlined"},
  {Attribute::SlowBlink,             5,  5, "SlowBlink"},
  {Attribute::RapidBlink,            6,  6, "RapidBlink"},
  {Attribute::Reverse,               7,  7, "Reverse"},
  {Attribute::Hidden,                8,  8, "Hidden"},
  {Attribute::CrossedOut,            9,  9, "CrossedOut"},
  {Attribute::Fraktur,              10, 20, "Fraktur"},
  {Attribute::NoBold,               11, 21, "NoBold"},
  {Attribute::NormalIntensity,      12, 22, "NormalIntensity"},
  {Attribute::NoItalic,             13, 23, "NoItalic"},
  {Attribute::NoUnderline,          14, 24, "NoUnderline"},
  {Attribute::NoBlink,              15, 25, "NoBlink"},
  {Attribute::NoReverse,            16, 27, "NoReverse"},
  {Attribute::NoHidden,             17, 28, "NoHidden"},
  {Attribute::NotCrossedOut,        18, 29, "NotCrossedOut"},
  {Attribute::Framed,               19, 51, "Framed"},
  {Attribute::Encircled,            20, 52, "Encircled"},
  {Attribute::OverLined,            21, 53, "OverLined"},
  {Attribute::NotFramedOrEncircled, 22, 54, "NotFramedOrEncircled"},
  {Attribute::NotOverLined,         23, 55, "NotOverLined"},
}};

constexpr bool table_is_coupled() {
  for (size_t i = 0; i < kTable.size(); ++i) {
    if (static_cast<size_t>(kTable[i].kind) != i) return false;
    if (kTable[i].bit != i) return false;
  }
  return true;
}

static_assert(kTable.size() <= 32, "attribute table must fit the 32-bit mask");
static_assert(table_is_coupled(), "attribute table must follow declaration order");

} // namespace

std::span<const AttributeInfo> attribute_table() { return kTable; }

const AttributeInfo& attribute_info(Attribute a) {
  auto idx = static_cast<size_t>(a);
  if (idx >= kTable.size())
    throw std::out_of_range("attribute out of range: " + std::to_string(idx));
  return kTable[idx];
}

std::uint32_t attribute_bit(Attribute a) { return std::uint32_t{1} << attribute_info(a).bit; }

unsigned char sgr_code(Attribute a) { return attribute_info(a).sgr; }

std::string_view attribute_name(Attribute a) { return attribute_info(a).name; }
