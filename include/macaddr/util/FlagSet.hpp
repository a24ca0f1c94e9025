// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#pragma once

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace macaddr::util
{
/**
 * @brief Set of flags of a scoped enum whose last enumerator is `FlagsCount`.
 *
 * Streams as `A|B|C`, or `None` when empty; requires an `operator<<` for the enum.
 */
template<typename Enum>
class FlagSet
{
    static_assert(std::is_scoped_enum_v<Enum>, "Template parameter must be a scoped enum");
    static_assert(std::is_unsigned_v<std::underlying_type_t<Enum>>,
                  "Enum must have an unsigned integral underlying type");
    static_assert(requires { Enum::FlagsCount; }, "Enum must define FlagsCount enumerator");
    static constexpr std::size_t FLAG_COUNT = std::to_underlying(Enum::FlagsCount);

  public:
    using EnumType = Enum;

    FlagSet() = default;

    FlagSet(std::initializer_list<EnumType> flags)
    {
        for (const auto flag : flags) {
            set(flag);
        }
    }

    [[nodiscard]] constexpr static auto size() -> std::size_t { return FLAG_COUNT; }

    [[nodiscard]] auto count() const -> std::size_t { return m_flags.count(); }

    [[nodiscard]] auto none() const -> bool { return m_flags.none(); }

    [[nodiscard]] auto any() const -> bool { return m_flags.any(); }

    auto set(EnumType flag, bool value = true) -> void { m_flags.set(std::to_underlying(flag), value); }

    [[nodiscard]] auto test(EnumType flag) const -> bool { return m_flags.test(std::to_underlying(flag)); }

    [[nodiscard]] auto toString() const -> std::string
    {
        std::ostringstream oss;
        bool first = true;
        for (std::size_t i = 0; i < FLAG_COUNT; ++i) {
            if (m_flags.test(i)) {
                if (!first) {
                    oss << "|";
                }
                first = false;
                oss << static_cast<Enum>(i);
            }
        }
        if (first) {
            return "None";
        }
        return oss.str();
    }

    [[nodiscard]] auto operator==(const FlagSet& other) const -> bool = default;

  private:
    std::bitset<FLAG_COUNT> m_flags {};
};
}  // namespace macaddr::util
