// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <cctype>
#include <ostream>
#include <utility>

#include <ethernet/Notation.hpp>
#include <spdlog/spdlog.h>

namespace macaddr::ethernet
{

namespace
{

auto isHexDigit(const char c) -> bool
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

auto matches(const Grammar& grammar, const std::string_view text) -> bool
{
    if (text.size() != grammar.length()) {
        return false;
    }
    const auto stride = grammar.groupWidth + 1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (grammar.groups > 1 && i % stride == grammar.groupWidth) {
            if (text[i] != grammar.separator) {
                return false;
            }
        } else if (!isHexDigit(text[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto operator<<(std::ostream& o, const Notation n) -> std::ostream&
{
    using enum Notation;
    switch (n) {
        case Plain:
            return o << "plain";
        case Hyphen:
            return o << "hyphen";
        case Colon:
            return o << "colon";
        case Dot:
            return o << "dot";
        default:
            return o << "Unknown Notation: 0x" << std::hex << static_cast<int>(n);
    }
}

auto grammarOf(const Notation n) -> const Grammar&
{
    return GRAMMARS.at(std::to_underlying(n));
}

ValidationError::ValidationError()
    : std::invalid_argument("Pass in 12 hexadecimal digits.")
{
}

auto detectNotation(const std::string_view text) -> std::optional<Notation>
{
    const auto it = std::ranges::find_if(GRAMMARS, [text](const Grammar& g) { return matches(g, text); });
    if (it == GRAMMARS.cend()) {
        return std::nullopt;
    }
    return it->notation;
}

auto isValid(const std::string_view text) -> bool
{
    return detectNotation(text).has_value();
}

auto normalize(const std::string_view text) noexcept(false) -> std::string
{
    const auto notation = detectNotation(text);
    if (!notation) {
        spdlog::debug("Rejecting '{}': matches no MAC address notation", text);
        throw ValidationError();
    }
    spdlog::trace("Parsing '{}' in {} notation", text, *notation);

    std::string digits;
    digits.reserve(HEX_DIGITS);
    for (const char c : text) {
        if (isHexDigit(c)) {
            digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return digits;
}

auto render(const std::string_view digits, const Notation n) -> std::string
{
    const auto& grammar = grammarOf(n);
    std::string out;
    out.reserve(grammar.length());
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && i % grammar.groupWidth == 0) {
            out.push_back(grammar.separator);
        }
        out.push_back(digits[i]);
    }
    return out;
}

}  // namespace macaddr::ethernet
