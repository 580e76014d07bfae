#pragma once

#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
struct BitFieldOperatorsEnabled
{
    static constexpr bool value = false;
};
} // namespace detail

template<typename BitFieldTy>
concept BitField = std::is_enum_v<BitFieldTy> && detail::BitFieldOperatorsEnabled<BitFieldTy>::value;

// Call this on the enum class type that shall have the operators enabled
#define ENABLE_BITFIELD_OPERATORS(bitfield)           \
    template<>                                        \
    struct detail::BitFieldOperatorsEnabled<bitfield> \
    {                                                 \
        static constexpr bool value = true;           \
    }

template<BitField BitFieldTy>
inline constexpr BitFieldTy operator&(const BitFieldTy& lhs, const BitFieldTy& rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(static_cast<BaseTy>(lhs) & static_cast<BaseTy>(rhs));
}
template<BitField BitFieldTy>
inline constexpr BitFieldTy operator|(const BitFieldTy& lhs, const BitFieldTy& rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(static_cast<BaseTy>(lhs) | static_cast<BaseTy>(rhs));
}

/*
        True if any bit of rhs is set in lhs
*/
template<BitField BitFieldTy>
inline constexpr bool IsAnySet(const BitFieldTy& lhs, const BitFieldTy& rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BaseTy>(lhs & rhs) != BaseTy{};
}

template<class T>
consteval T Bit(T ith)
{
    return static_cast<T>(1u << ith);
}

// NOLINTEND
