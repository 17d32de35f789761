// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Endian.h"
#include "StreamAccess.h"
#include "../Utility/BitUtils.h"
#include "../Utility/ImpliedTyping.h"
#include <type_traits>

namespace BinLayout
{
    class Context;

    namespace Internal
    {
        template<typename Type> struct FitsInWord : std::bool_constant<(sizeof(Type) <= 8)> {};
        template<typename Type> struct IsWideCharacter : std::bool_constant<std::is_same_v<Type, char16_t> || std::is_same_v<Type, wchar_t>> {};

            // conjunction short circuits, so this is safe to ask of incomplete record types
        template<typename Type>
            constexpr bool IsPrimitive = std::conjunction_v<
                std::is_arithmetic<Type>,
                std::negation<std::is_same<Type, bool>>,
                std::negation<IsWideCharacter<Type>>,
                FitsInWord<Type>>;

        template<typename Type>
            constexpr ImpliedTyping::TypeDesc DescribePrimitive()
        {
            using namespace ImpliedTyping;
            if constexpr (std::is_same_v<Type, char>) {
                return TypeDesc{TypeCat::UInt8, TypeHint::Character};
            } else if constexpr (std::is_same_v<Type, char32_t>) {
                return TypeDesc{TypeCat::UInt32, TypeHint::Character};
            } else if constexpr (std::is_floating_point_v<Type>) {
                return TypeDesc{(sizeof(Type) == 4) ? TypeCat::Float : TypeCat::Double};
            } else if constexpr (sizeof(Type) == 1) {
                return TypeDesc{std::is_signed_v<Type> ? TypeCat::Int8 : TypeCat::UInt8};
            } else if constexpr (sizeof(Type) == 2) {
                return TypeDesc{std::is_signed_v<Type> ? TypeCat::Int16 : TypeCat::UInt16};
            } else if constexpr (sizeof(Type) == 4) {
                return TypeDesc{std::is_signed_v<Type> ? TypeCat::Int32 : TypeCat::UInt32};
            } else
                return TypeDesc{std::is_signed_v<Type> ? TypeCat::Int64 : TypeCat::UInt64};
        }

        void TracePrimitive(uint64_t position, const Context& ctx, IteratorRange<const void*> value, ImpliedTyping::TypeDesc type);
    }

    /// <summary>Decode a fixed width integer or floating point value</summary>
    /// Reads exactly sizeof(Type) bytes and interprets them in the given byte order.
    /// Characters (char and char32_t) are decoded from a single byte, reinterpreted
    /// as a code point. char16_t and wchar_t are not primitives; read 16 bit text with
    /// NullWideString or as uint16_t. Raises IOError if the stream can't supply enough bytes.
    template<typename Type>
        Type DecodePrimitive(Utility::IInputStream& stream, Endian byteOrder)
    {
        static_assert(Internal::IsPrimitive<Type>, "DecodePrimitive only supports fixed width arithmetic types");
        if constexpr (std::is_same_v<Type, char32_t>) {
            return char32_t(DecodePrimitive<uint8_t>(stream, byteOrder));
        } else {
            Type result;
            ReadExact(stream, MakeOpaqueIteratorRange(result));
            if constexpr (sizeof(Type) > 1)
                if (RequiresByteSwap(byteOrder))
                    result = FlipEndian(result);
            return result;
        }
    }
}
