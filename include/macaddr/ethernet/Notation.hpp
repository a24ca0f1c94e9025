// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/ostream.h>

namespace macaddr::ethernet
{

constexpr std::size_t HEX_DIGITS = 12;

enum class Notation : uint8_t
{
    Plain,   // a0b1c2d3e4f5
    Hyphen,  // a0-b1-c2-d3-e4-f5
    Colon,   // a0:b1:c2:d3:e4:f5
    Dot,     // a0b1.c2d3.e4f5
};
auto operator<<(std::ostream& o, Notation n) -> std::ostream&;

/**
 * @brief Shape of one accepted notation: `groups` runs of `groupWidth` hex digits joined by `separator`.
 */
struct Grammar
{
    Notation notation;
    std::size_t groups;
    std::size_t groupWidth;
    char separator;

    [[nodiscard]] constexpr auto length() const -> std::size_t { return (groups * groupWidth) + groups - 1; }
};

constexpr std::array<Grammar, 4> GRAMMARS {{
    {Notation::Plain, 1, HEX_DIGITS, '\0'},
    {Notation::Hyphen, 6, 2, '-'},
    {Notation::Colon, 6, 2, ':'},
    {Notation::Dot, 3, 4, '.'},
}};

[[nodiscard]] auto grammarOf(Notation n) -> const Grammar&;

class ValidationError : public std::invalid_argument
{
  public:
    ValidationError();
};

/**
 * @brief Returns the notation the whole of @p text matches, if any. Hex digits are matched case-insensitively.
 */
[[nodiscard]] auto detectNotation(std::string_view text) -> std::optional<Notation>;

[[nodiscard]] auto isValid(std::string_view text) -> bool;

/**
 * @brief Lowercases @p text and strips its separators.
 *
 * @return exactly HEX_DIGITS lowercase hex digits
 * @throws ValidationError if @p text matches none of the accepted notations
 */
[[nodiscard]] auto normalize(std::string_view text) noexcept(false) -> std::string;

/**
 * @brief Groups already normalized @p digits according to the grammar of @p n.
 */
[[nodiscard]] auto render(std::string_view digits, Notation n) -> std::string;

}  // namespace macaddr::ethernet

template<>
struct fmt::formatter<macaddr::ethernet::Notation> : ostream_formatter
{
};
