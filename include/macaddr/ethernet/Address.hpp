// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

#include <ethernet/Notation.hpp>
#include <fmt/ostream.h>
#include <util/FlagSet.hpp>

namespace macaddr::ethernet
{

constexpr std::size_t ADDR_LEN = 6;
using Bytes = std::array<uint8_t, ADDR_LEN>;

/** OUI or CID first, interface specific part second; 6 hex digits each */
using Fragments = std::pair<std::string, std::string>;

enum class Kind : uint8_t
{
    Unique,   // EUI, carries an OUI
    Local,    // ELI, carries a CID
    Unknown,
};
auto operator<<(std::ostream& o, Kind k) -> std::ostream&;

enum class Property : uint8_t
{
    Broadcast,
    Multicast,
    Unicast,
    UniversallyAdministered,
    LocallyAdministered,
    HasOui,
    HasCid,
    FlagsCount,
};
using Properties = util::FlagSet<Property>;
auto operator<<(std::ostream& o, Property p) -> std::ostream&;
auto operator<<(std::ostream& o, const Properties& p) -> std::ostream&;

/**
 * @brief 48-bit IEEE extended identifier (MAC address).
 *
 * Immutable once constructed. Classification reads the first octet, where the I/G bit is the least-significant
 * bit and the U/L bit the second-least-significant bit.
 */
class Address
{
  public:
    /**
     * @brief Parses @p text in plain, hyphen, colon or dot notation, hex digits in any case.
     * @throws ValidationError if @p text matches none of the notations
     */
    explicit Address(std::string_view text) noexcept(false);
    explicit Address(const Bytes& bytes);

    static auto fromString(std::string_view text) noexcept(false) -> Address;

    [[nodiscard]] auto bytes() const -> const Bytes&;

    [[nodiscard]] auto toPlainNotation() const -> std::string;
    [[nodiscard]] auto toHyphenNotation() const -> std::string;
    [[nodiscard]] auto toColonNotation() const -> std::string;
    [[nodiscard]] auto toDotNotation() const -> std::string;
    [[nodiscard]] auto toNotation(Notation n) const -> std::string;
    [[nodiscard]] auto toString() const -> std::string;

    /** MSB of each octet first, 48 characters */
    [[nodiscard]] auto toBinaryRepresentation() const -> std::string;
    [[nodiscard]] auto toDecimalRepresentation() const -> uint64_t;
    [[nodiscard]] auto toFragments() const -> Fragments;

    [[nodiscard]] auto kind() const -> Kind;
    [[nodiscard]] auto hasOui() const -> bool;
    [[nodiscard]] auto hasCid() const -> bool;

    [[nodiscard]] auto isBroadcast() const -> bool;
    [[nodiscard]] auto isMulticast() const -> bool;
    [[nodiscard]] auto isUnicast() const -> bool;
    [[nodiscard]] auto isUaa() const -> bool;
    [[nodiscard]] auto isLaa() const -> bool;

    [[nodiscard]] auto properties() const -> Properties;

    auto operator<=>(const Address& other) const -> std::strong_ordering;
    auto operator==(const Address& other) const -> bool = default;

  private:
    Bytes m_bytes;
};

auto operator<<(std::ostream& o, const Address& a) -> std::ostream&;

}  // namespace macaddr::ethernet

template<>
struct std::hash<macaddr::ethernet::Address>
{
    auto operator()(const macaddr::ethernet::Address& a) const noexcept -> std::size_t
    {
        return std::hash<uint64_t> {}(a.toDecimalRepresentation());
    }
};

template<>
struct fmt::formatter<macaddr::ethernet::Address> : ostream_formatter
{
};

template<>
struct fmt::formatter<macaddr::ethernet::Kind> : ostream_formatter
{
};

template<>
struct fmt::formatter<macaddr::ethernet::Property> : ostream_formatter
{
};

template<>
struct fmt::formatter<macaddr::ethernet::Properties> : ostream_formatter
{
};
