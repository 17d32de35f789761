// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "IteratorUtils.h"
#include "StringUtils.h"
#include "../Core/Exceptions.h"
#include <string>
#include <optional>
#include <stdexcept>
#include <cstring>

namespace Utility
{
    namespace ImpliedTyping
    {
        enum class TypeCat : uint8_t { Void, Bool, Int8, UInt8, Int16, UInt16, Int32, UInt32, Int64, UInt64, Float, Double };
        enum class TypeHint : uint8_t { None, Character };
        class TypeDesc
        {
        public:
            TypeCat     _type = TypeCat::UInt32;
            TypeHint    _typeHint = TypeHint::None;

            constexpr uint32_t GetSize() const;
            constexpr TypeDesc() = default;
            constexpr TypeDesc(TypeCat typeCat, TypeHint typeHint = TypeHint::None) : _type(typeCat), _typeHint(typeHint) {}

            friend constexpr bool operator==(const TypeDesc& lhs, const TypeDesc& rhs);
            friend constexpr bool operator!=(const TypeDesc& lhs, const TypeDesc& rhs);
        };

        //
        //  Descriptors for the fixed width scalar types that appear in binary layouts.
        //  These let us carry a value whose type is only known at runtime (eg, the
        //  unexpected value found in place of a magic number) and print it for
        //  diagnostics.
        //

        std::string AsString(IteratorRange<const void*> data, const TypeDesc&, bool strongTyping = false);

        template<typename Type>
            inline std::string AsString(const Type& type, bool strongTyping = false);

        const char* AsString(TypeCat);

        // Scalar conversion between type categories. Narrowing conversions truncate the
        // same way a C++ static_cast would. Returns false if either type is Void or the
        // buffers are too small
        bool Cast(
            IteratorRange<void*> dest, TypeDesc destType,
            IteratorRange<const void*> src, TypeDesc srcType);

        /// <summary>A scalar value of runtime determined type, with its own storage</summary>
        struct VariantRetained
        {
            TypeDesc _type = TypeCat::Void;
            alignas(uint64_t) uint8_t _smallBuffer[sizeof(uint64_t)];

            template<typename DestType>
                DestType RequireCastValue() const;

            template<typename DestType>
                std::optional<DestType> TryCastValue() const;

            IteratorRange<const void*> GetData() const { return { _smallBuffer, PtrAdd(_smallBuffer, _type.GetSize()) }; }

            template<typename SrcType>
                VariantRetained(SrcType);
            VariantRetained(TypeDesc, IteratorRange<const void*>);
            VariantRetained() = default;
        };

        //////////////////////////////////////////////////////////////////////////////////////
            // Template implementations //
        //////////////////////////////////////////////////////////////////////////////////////
        constexpr TypeDesc InternalTypeOf(uint64_t const*)        { return TypeDesc{TypeCat::UInt64}; }
        constexpr TypeDesc InternalTypeOf(int64_t const*)         { return TypeDesc{TypeCat::Int64}; }
        constexpr TypeDesc InternalTypeOf(uint32_t const*)        { return TypeDesc{TypeCat::UInt32}; }
        constexpr TypeDesc InternalTypeOf(int32_t const*)         { return TypeDesc{TypeCat::Int32}; }
        constexpr TypeDesc InternalTypeOf(uint16_t const*)        { return TypeDesc{TypeCat::UInt16}; }
        constexpr TypeDesc InternalTypeOf(int16_t const*)         { return TypeDesc{TypeCat::Int16}; }
        constexpr TypeDesc InternalTypeOf(uint8_t const*)         { return TypeDesc{TypeCat::UInt8}; }
        constexpr TypeDesc InternalTypeOf(int8_t const*)          { return TypeDesc{TypeCat::Int8}; }
        constexpr TypeDesc InternalTypeOf(char const*)            { return TypeDesc{TypeCat::UInt8, TypeHint::Character}; }
        constexpr TypeDesc InternalTypeOf(char32_t const*)        { return TypeDesc{TypeCat::UInt32, TypeHint::Character}; }
        constexpr TypeDesc InternalTypeOf(bool const*)            { return TypeDesc{TypeCat::Bool}; }
        constexpr TypeDesc InternalTypeOf(float const*)           { return TypeDesc{TypeCat::Float}; }
        constexpr TypeDesc InternalTypeOf(double const*)          { return TypeDesc{TypeCat::Double}; }

        template<typename Type> 
            constexpr decltype(InternalTypeOf(std::declval<Type const*>())) TypeOf() { return InternalTypeOf((Type const*)nullptr); }

        constexpr uint32_t TypeDesc::GetSize() const
        {
            switch (_type) {
            case TypeCat::Bool: return sizeof(bool);

            case TypeCat::Int8:
            case TypeCat::UInt8: return sizeof(uint8_t);

            case TypeCat::Int16:
            case TypeCat::UInt16: return sizeof(uint16_t);

            case TypeCat::Int32:
            case TypeCat::UInt32:
            case TypeCat::Float: return sizeof(uint32_t);

            case TypeCat::Int64:
            case TypeCat::UInt64:
            case TypeCat::Double: return sizeof(uint64_t);

            case TypeCat::Void:
            default: return 0;
            }
        }

        constexpr bool operator==(const TypeDesc& lhs, const TypeDesc& rhs)
        {
                // (type hint is ignored, because it doesn't change the layout of the data)
            return lhs._type == rhs._type;
        }

        constexpr bool operator!=(const TypeDesc& lhs, const TypeDesc& rhs) { return !operator==(lhs, rhs); }

        template<typename Type>
            inline std::string AsString(const Type& type, bool strongTyping)
            {
                return AsString(MakeOpaqueIteratorRange(type), TypeOf<Type>(), strongTyping);
            }

        template<typename SrcType>
            VariantRetained::VariantRetained(SrcType src)
        {
            _type = TypeOf<SrcType>();
            static_assert(sizeof(SrcType) <= sizeof(_smallBuffer));
            std::memcpy(_smallBuffer, &src, sizeof(SrcType));
        }

        template<typename DestType>
            std::optional<DestType> VariantRetained::TryCastValue() const
        {
            DestType result;
            if (Cast(MakeOpaqueIteratorRange(result), TypeOf<DestType>(), GetData(), _type))
                return result;
            return {};
        }

        template<typename DestType>
            DestType VariantRetained::RequireCastValue() const
        {
            auto result = TryCastValue<DestType>();
            if (!result)
                Throw(std::runtime_error(std::string{"Could not cast value of type ("} + AsString(_type._type) + ") to (" + AsString(TypeOf<DestType>()._type) + ")"));
            return *result;
        }
    }
}

using namespace Utility;
