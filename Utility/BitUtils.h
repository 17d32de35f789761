// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Prefix.h"
#include <cstring>
#include <type_traits>

namespace Utility
{
    template <typename Type>
        constexpr Type CeilToMultiple(Type input, Type multiple)
    {
            // returns "input", or the next largest multiple of "multiple". "multiple" must be non-zero
        return ((input + multiple - 1) / multiple) * multiple;
    }

    constexpr uint8_t ByteSwap(uint8_t input) { return input; }

    constexpr uint16_t ByteSwap(uint16_t input)
    {
        return uint16_t((input >> 8) | (input << 8));
    }

    constexpr uint32_t ByteSwap(uint32_t input)
    {
        return  ((input & 0x000000ffu) << 24u)
            |   ((input & 0x0000ff00u) <<  8u)
            |   ((input & 0x00ff0000u) >>  8u)
            |   ((input & 0xff000000u) >> 24u);
    }

    constexpr uint64_t ByteSwap(uint64_t input)
    {
        return (uint64_t(ByteSwap(uint32_t(input))) << 32ull) | uint64_t(ByteSwap(uint32_t(input >> 32ull)));
    }

    namespace Internal
    {
        template<size_t Size> struct UIntOfSize;
        template<> struct UIntOfSize<1> { using Type = uint8_t; };
        template<> struct UIntOfSize<2> { using Type = uint16_t; };
        template<> struct UIntOfSize<4> { using Type = uint32_t; };
        template<> struct UIntOfSize<8> { using Type = uint64_t; };
    }

    /// <summary>Reverse the byte order of any 1, 2, 4 or 8 byte trivially copyable value</summary>
    /// Goes through an unsigned integer of the same width, so it works for floating point types, too.
    template<typename Type>
        Type FlipEndian(Type input)
    {
        static_assert(std::is_trivially_copyable_v<Type>, "FlipEndian requires a trivially copyable type");
        using UInt = typename Internal::UIntOfSize<sizeof(Type)>::Type;
        UInt asInt;
        std::memcpy(&asInt, &input, sizeof(Type));
        asInt = ByteSwap(asInt);
        Type result;
        std::memcpy(&result, &asInt, sizeof(Type));
        return result;
    }
}

using namespace Utility;
