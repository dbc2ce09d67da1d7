#pragma once

#include <cstdint>
#include <string_view>

namespace gambit {

enum class Colour : std::uint8_t { White = 0, Black = 1 };

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

constexpr std::string_view to_string(Colour colour) {
  return colour == Colour::White ? "white" : "black";
}

} // namespace gambit
