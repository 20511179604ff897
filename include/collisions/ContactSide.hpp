/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTACT_SIDE_HPP
#define CONTACT_SIDE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace StrataEngine {

// Side of an entity hitbox touching a tile. Any is the union of the other four.
enum class ContactSide : uint8_t {
  Top = 0,
  Bottom,
  Left,
  Right,
  Any
};

constexpr size_t CONTACT_SIDE_COUNT = 5;

inline constexpr std::string_view toString(ContactSide side) {
  switch (side) {
  case ContactSide::Top:
    return "top";
  case ContactSide::Bottom:
    return "bottom";
  case ContactSide::Left:
    return "left";
  case ContactSide::Right:
    return "right";
  case ContactSide::Any:
    return "any";
  }
  return "unknown";
}

// Parses the four physical sides; "any" is not a valid tile side
inline std::optional<ContactSide> contactSideFromString(std::string_view name) {
  if (name == "top") return ContactSide::Top;
  if (name == "bottom") return ContactSide::Bottom;
  if (name == "left") return ContactSide::Left;
  if (name == "right") return ContactSide::Right;
  return std::nullopt;
}

inline std::ostream &operator<<(std::ostream &os, ContactSide side) {
  return os << toString(side);
}

} // namespace StrataEngine

#endif // CONTACT_SIDE_HPP
