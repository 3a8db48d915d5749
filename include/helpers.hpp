#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>

namespace ctrace::compdb
{

template<typename E>
struct EnumTraits; // no generic definition -> error if not specialized

template<typename E>
concept EnumWithTraits = std::is_enum_v<E> && requires {
    EnumTraits<E>::names;
};

template<EnumWithTraits E>
constexpr std::string_view enumToString(E e) noexcept
{
    using Traits = EnumTraits<E>;
    using U = std::underlying_type_t<E>;

    constexpr auto size = Traits::names.size();
    const auto idx = static_cast<U>(e);

    if (idx < 0 || static_cast<std::size_t>(idx) >= size)
        return "Unknown";

    return Traits::names[static_cast<std::size_t>(idx)];
}

// Reverse lookup, used for `--flag=value` style options. Enumerators must be
// contiguous from 0 for this to hold.
template<EnumWithTraits E>
constexpr std::optional<E> enumFromString(std::string_view name) noexcept
{
    using Traits = EnumTraits<E>;

    for (std::size_t i = 0; i < Traits::names.size(); ++i)
    {
        if (Traits::names[i] == name)
            return static_cast<E>(i);
    }
    return std::nullopt;
}

} // namespace ctrace::compdb
