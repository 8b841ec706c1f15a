#include "attributes.hpp"
#include <bit>

Attribute Attributes::Iterator::operator*() const {
  auto bit = static_cast<unsigned>(std::countr_zero(remaining_));
  return attribute_table()[bit].kind;
}

Attributes::Iterator& Attributes::Iterator::operator++() {
  remaining_ &= remaining_ - 1; // drop lowest set bit
  return *this;
}

std::optional<Attribute> Attributes::Iterator::next() {
  if (remaining_ == 0) return std::nullopt;
  Attribute a = **this;
  ++*this;
  return a;
}

Attributes::Attributes(Attribute a) : bits_(attribute_bit(a)) {}

Attributes::Attributes(std::initializer_list<Attribute> attrs) {
  for (Attribute a : attrs) set(a);
}

Attributes::Attributes(std::span<const Attribute> attrs) {
  for (Attribute a : attrs) set(a);
}

int Attributes::size() const { return std::popcount(bits_); }

Attributes Attributes::intersection(const Attributes& other) const {
  Attributes r; r.bits_ = bits_ & other.bits_; return r;
}

Attributes Attributes::union_with(const Attributes& other) const {
  Attributes r; r.bits_ = bits_ | other.bits_; return r;
}

Attributes Attributes::symmetric_difference(const Attributes& other) const {
  Attributes r; r.bits_ = bits_ ^ other.bits_; return r;
}

Attributes operator&(const Attributes& lhs, const Attributes& rhs) { return lhs.intersection(rhs); }
Attributes operator|(const Attributes& lhs, const Attributes& rhs) { return lhs.union_with(rhs); }
Attributes operator^(const Attributes& lhs, const Attributes& rhs) { return lhs.symmetric_difference(rhs); }
Attributes operator|(Attribute lhs, Attribute rhs) { return Attributes{lhs, rhs}; }

namespace {

struct CancelRule { Attribute marker; Attributes cancels; };

const CancelRule kCancelRules[] = {
  {Attribute::NoBold,               {Attribute::Bold}},
  {Attribute::NormalIntensity,      {Attribute::Bold, Attribute::Dim}},
  {Attribute::NoItalic,             {Attribute::Italic, Attribute::Fraktur}},
  {Attribute::NoUnderline,          {Attribute::Underlined}},
  {Attribute::NoBlink,              {Attribute::SlowBlink, Attribute::RapidBlink}},
  {Attribute::NoReverse,            {Attribute::Reverse}},
  {Attribute::NoHidden,             {Attribute::Hidden}},
  {Attribute::NotCrossedOut,        {Attribute::CrossedOut}},
  {Attribute::NotFramedOrEncircled, {Attribute::Framed, Attribute::Encircled}},
  {Attribute::NotOverLined,         {Attribute::OverLined}},
};

} // namespace

Attributes apply_attribute(Attributes active, Attribute a) {
  attribute_info(a); // fail fast on unknown kinds
  if (a == Attribute::Reset) return Attributes();
  for (const auto& rule : kCancelRules) {
    if (rule.marker != a) continue;
    return active.symmetric_difference(active.intersection(rule.cancels));
  }
  active.set(a);
  return active;
}
