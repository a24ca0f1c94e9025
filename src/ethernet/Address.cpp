// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <algorithm>
#include <bitset>
#include <ostream>

#include <ethernet/Address.hpp>

namespace macaddr::ethernet
{

namespace
{
constexpr auto HEX_CHARS = "0123456789abcdef";
constexpr auto NIBBLE_BITS = 4U;
constexpr auto NIBBLE_MASK = 0xFU;

// bits of the first octet, numbered from the MSB: I/G is bit 7, U/L is bit 6
constexpr uint8_t GROUP_BIT = 0x01U;
constexpr uint8_t LOCAL_BIT = 0x02U;
constexpr uint8_t UNIQUE_KIND_MASK = 0x03U;  // bits 6..7
constexpr uint8_t LOCAL_KIND_MASK = 0x0FU;   // bits 4..7
constexpr uint8_t LOCAL_KIND_BITS = 0x0AU;

auto nibble(const char digit) -> uint8_t
{
    constexpr auto DECIMAL_DIGITS = 10;
    return digit <= '9' ? static_cast<uint8_t>(digit - '0') : static_cast<uint8_t>(digit - 'a' + DECIMAL_DIGITS);
}

auto parse(const std::string_view text) -> Bytes
{
    const auto digits = normalize(text);
    Bytes bytes {};
    for (std::size_t i = 0; i < ADDR_LEN; ++i) {
        bytes[i] = static_cast<uint8_t>((nibble(digits[2 * i]) << NIBBLE_BITS) | nibble(digits[(2 * i) + 1]));
    }
    return bytes;
}
}  // namespace

Address::Address(const std::string_view text) noexcept(false)
    : m_bytes {parse(text)}
{
}

Address::Address(const Bytes& bytes)
    : m_bytes {bytes}
{
}

auto Address::fromString(const std::string_view text) noexcept(false) -> Address
{
    return Address(text);
}

auto Address::bytes() const -> const Bytes&
{
    return m_bytes;
}

auto Address::toPlainNotation() const -> std::string
{
    std::string digits;
    digits.reserve(HEX_DIGITS);
    for (const auto octet : m_bytes) {
        digits.push_back(HEX_CHARS[octet >> NIBBLE_BITS]);
        digits.push_back(HEX_CHARS[octet & NIBBLE_MASK]);
    }
    return digits;
}

auto Address::toHyphenNotation() const -> std::string
{
    return toNotation(Notation::Hyphen);
}

auto Address::toColonNotation() const -> std::string
{
    return toNotation(Notation::Colon);
}

auto Address::toDotNotation() const -> std::string
{
    return toNotation(Notation::Dot);
}

auto Address::toNotation(const Notation n) const -> std::string
{
    return render(toPlainNotation(), n);
}

auto Address::toString() const -> std::string
{
    return toColonNotation();
}

auto Address::toBinaryRepresentation() const -> std::string
{
    constexpr auto OCTET_BITS = 8;
    std::string binary;
    binary.reserve(ADDR_LEN * OCTET_BITS);
    for (const auto octet : m_bytes) {
        binary += std::bitset<OCTET_BITS>(octet).to_string();
    }
    return binary;
}

auto Address::toDecimalRepresentation() const -> uint64_t
{
    constexpr auto OCTET_BITS = 8U;
    uint64_t value = 0;
    for (const auto octet : m_bytes) {
        value = (value << OCTET_BITS) | octet;
    }
    return value;
}

auto Address::toFragments() const -> Fragments
{
    constexpr auto FRAGMENT_DIGITS = HEX_DIGITS / 2;
    const auto plain = toPlainNotation();
    return {plain.substr(0, FRAGMENT_DIGITS), plain.substr(FRAGMENT_DIGITS)};
}

auto Address::kind() const -> Kind
{
    // the unique check must come first, the local pattern overlaps it
    const auto first = m_bytes[0];
    if ((first & UNIQUE_KIND_MASK) == 0) {
        return Kind::Unique;
    }
    if ((first & LOCAL_KIND_MASK) == LOCAL_KIND_BITS) {
        return Kind::Local;
    }
    return Kind::Unknown;
}

auto Address::hasOui() const -> bool
{
    return kind() == Kind::Unique;
}

auto Address::hasCid() const -> bool
{
    return kind() == Kind::Local;
}

auto Address::isBroadcast() const -> bool
{
    constexpr uint8_t BROADCAST_BYTE = 0xFF;
    return std::ranges::all_of(m_bytes, [](const uint8_t byte) { return byte == BROADCAST_BYTE; });
}

auto Address::isMulticast() const -> bool
{
    return (m_bytes[0] & GROUP_BIT) != 0;
}

auto Address::isUnicast() const -> bool
{
    return !isMulticast();
}

auto Address::isUaa() const -> bool
{
    return isUnicast() && (m_bytes[0] & LOCAL_BIT) == 0;
}

auto Address::isLaa() const -> bool
{
    return isUnicast() && (m_bytes[0] & LOCAL_BIT) != 0;
}

auto Address::properties() const -> Properties
{
    Properties p;
    p.set(Property::Broadcast, isBroadcast());
    p.set(Property::Multicast, isMulticast());
    p.set(Property::Unicast, isUnicast());
    p.set(Property::UniversallyAdministered, isUaa());
    p.set(Property::LocallyAdministered, isLaa());
    p.set(Property::HasOui, hasOui());
    p.set(Property::HasCid, hasCid());
    return p;
}

auto Address::operator<=>(const Address& other) const -> std::strong_ordering
{
    return m_bytes <=> other.m_bytes;
}

auto operator<<(std::ostream& o, const Kind k) -> std::ostream&
{
    using enum Kind;
    switch (k) {
        case Unique:
            return o << "unique";
        case Local:
            return o << "local";
        case Unknown:
        default:
            return o << "unknown";
    }
}

auto operator<<(std::ostream& o, const Property p) -> std::ostream&
{
    using enum Property;
    switch (p) {
        case Broadcast:
            return o << "Broadcast";
        case Multicast:
            return o << "Multicast";
        case Unicast:
            return o << "Unicast";
        case UniversallyAdministered:
            return o << "UniversallyAdministered";
        case LocallyAdministered:
            return o << "LocallyAdministered";
        case HasOui:
            return o << "HasOui";
        case HasCid:
            return o << "HasCid";
        default:
            return o << "Unknown Property: 0x" << std::hex << static_cast<int>(p);
    }
}

auto operator<<(std::ostream& o, const Properties& p) -> std::ostream&
{
    return o << p.toString();
}

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&
{
    return o << a.toString();
}

}  // namespace macaddr::ethernet
