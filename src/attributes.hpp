#pragma once
/*
 * Attributes
 *
 * Purpose: bitset of active text attributes with set algebra and ordered iteration.
 * Iteration: the iterator owns a copy of the mask, yields kinds in ascending bit
 *            order and never sees mutations made after it was built.
 * Equality: mask only; there is no cursor state inside the set.
 */
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include "attribute.hpp"

class Attributes {
public:
  using mask_type = std::uint32_t;

  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Attribute;
    using difference_type = std::ptrdiff_t;
    using pointer = const Attribute*;
    using reference = Attribute;

    Iterator() = default;
    explicit Iterator(mask_type remaining) : remaining_(remaining) {}

    Attribute operator*() const;
    Iterator& operator++();
    Iterator operator++(int) { Iterator old = *this; ++*this; return old; }
    bool operator==(const Iterator& other) const = default;

    // Returns the next kind and advances; nullopt once exhausted.
    std::optional<Attribute> next();

  private:
    mask_type remaining_ = 0;
  };

  Attributes() = default;
  Attributes(Attribute a);
  Attributes(std::initializer_list<Attribute> attrs);
  explicit Attributes(std::span<const Attribute> attrs);

  void set(Attribute a) { bits_ |= attribute_bit(a); }
  void unset(Attribute a) { bits_ &= ~attribute_bit(a); }
  void toggle(Attribute a) { bits_ ^= attribute_bit(a); }
  bool has(Attribute a) const { return (bits_ & attribute_bit(a)) != 0; }
  void extend(const Attributes& other) { bits_ |= other.bits_; }
  bool is_empty() const { return bits_ == 0; }
  mask_type bits() const { return bits_; }
  int size() const;

  Attributes intersection(const Attributes& other) const;
  Attributes union_with(const Attributes& other) const;
  Attributes symmetric_difference(const Attributes& other) const;

  Iterator begin() const { return Iterator(bits_); }
  Iterator end() const { return Iterator(); }

  bool operator==(const Attributes& other) const = default;

private:
  mask_type bits_ = 0;
};

Attributes operator&(const Attributes& lhs, const Attributes& rhs);
Attributes operator|(const Attributes& lhs, const Attributes& rhs);
Attributes operator^(const Attributes& lhs, const Attributes& rhs);
// Two bare kinds combine into a set.
Attributes operator|(Attribute lhs, Attribute rhs);

// Active set after the SGR for `a` is applied: Reset clears everything,
// No*/Not* kinds clear what they cancel, anything else is added.
Attributes apply_attribute(Attributes active, Attribute a);
