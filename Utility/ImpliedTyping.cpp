// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "ImpliedTyping.h"
#include <sstream>
#include <cstring>

namespace Utility { namespace ImpliedTyping
{
    const char* AsString(TypeCat type)
    {
        switch (type) {
        case TypeCat::Void:     return "void";
        case TypeCat::Bool:     return "bool";
        case TypeCat::Int8:     return "int8";
        case TypeCat::UInt8:    return "uint8";
        case TypeCat::Int16:    return "int16";
        case TypeCat::UInt16:   return "uint16";
        case TypeCat::Int32:    return "int32";
        case TypeCat::UInt32:   return "uint32";
        case TypeCat::Int64:    return "int64";
        case TypeCat::UInt64:   return "uint64";
        case TypeCat::Float:    return "float";
        case TypeCat::Double:   return "double";
        default:                return "<<unknown>>";
        }
    }

    template<typename Type>
        static Type LoadUnaligned(const void* src)
    {
        Type result;
        std::memcpy(&result, src, sizeof(Type));
        return result;
    }

    std::string AsString(IteratorRange<const void*> data, const TypeDesc& desc, bool strongTyping)
    {
        if (data.size() < desc.GetSize())
            Throw(std::runtime_error("Buffer too small for type in ImpliedTyping::AsString"));

        std::stringstream result;
        if (desc._typeHint == TypeHint::Character) {
            uint32_t codePoint = 0;
            Cast(MakeOpaqueIteratorRange(codePoint), TypeCat::UInt32, data, desc);
            if (codePoint >= 0x20 && codePoint < 0x7f) {
                result << '\'' << char(codePoint) << '\'';
            } else
                result << "U+" << std::hex << codePoint;
            return result.str();
        }

        auto* d = data.begin();
        if (strongTyping) {
            switch (desc._type) {
            case TypeCat::Bool:     if (LoadUnaligned<bool>(d)) { result << "true"; } else { result << "false"; }; break;
            case TypeCat::Int8:     result << (int32_t)LoadUnaligned<int8_t>(d) << "i8"; break;
            case TypeCat::UInt8:    result << (uint32_t)LoadUnaligned<uint8_t>(d) << "u8"; break;
            case TypeCat::Int16:    result << LoadUnaligned<int16_t>(d) << "i16"; break;
            case TypeCat::UInt16:   result << LoadUnaligned<uint16_t>(d) << "u16"; break;
            case TypeCat::Int32:    result << LoadUnaligned<int32_t>(d) << "i"; break;
            case TypeCat::UInt32:   result << LoadUnaligned<uint32_t>(d) << "u"; break;
            case TypeCat::Int64:    result << LoadUnaligned<int64_t>(d) << "i64"; break;
            case TypeCat::UInt64:   result << LoadUnaligned<uint64_t>(d) << "u64"; break;
            case TypeCat::Float:    result << LoadUnaligned<float>(d) << "f"; break;
            case TypeCat::Double:   result << LoadUnaligned<double>(d) << "f64"; break;
            case TypeCat::Void:     break;
            default:                result << "<<error>>"; break;
            }
        } else {
            switch (desc._type) {
            case TypeCat::Bool:     result << LoadUnaligned<bool>(d); break;
            case TypeCat::Int8:     result << (int32_t)LoadUnaligned<int8_t>(d); break;
            case TypeCat::UInt8:    result << (uint32_t)LoadUnaligned<uint8_t>(d); break;
            case TypeCat::Int16:    result << LoadUnaligned<int16_t>(d); break;
            case TypeCat::UInt16:   result << LoadUnaligned<uint16_t>(d); break;
            case TypeCat::Int32:    result << LoadUnaligned<int32_t>(d); break;
            case TypeCat::UInt32:   result << LoadUnaligned<uint32_t>(d); break;
            case TypeCat::Int64:    result << LoadUnaligned<int64_t>(d); break;
            case TypeCat::UInt64:   result << LoadUnaligned<uint64_t>(d); break;
            case TypeCat::Float:    result << LoadUnaligned<float>(d); break;
            case TypeCat::Double:   result << LoadUnaligned<double>(d); break;
            case TypeCat::Void:     break;
            default:                result << "<<error>>"; break;
            }
        }
        return result.str();
    }

    template<typename DestType, typename SrcType>
        static void StoreCast(IteratorRange<void*> dest, SrcType value)
    {
        DestType casted;
        if constexpr (std::is_same_v<DestType, bool>) {
            casted = value != SrcType(0);
        } else
            casted = static_cast<DestType>(value);
        std::memcpy(dest.begin(), &casted, sizeof(DestType));
    }

    template<typename SrcType>
        static bool StoreCast(IteratorRange<void*> dest, TypeCat destType, SrcType value)
    {
        switch (destType) {
        case TypeCat::Bool:     StoreCast<bool>(dest, value); return true;
        case TypeCat::Int8:     StoreCast<int8_t>(dest, value); return true;
        case TypeCat::UInt8:    StoreCast<uint8_t>(dest, value); return true;
        case TypeCat::Int16:    StoreCast<int16_t>(dest, value); return true;
        case TypeCat::UInt16:   StoreCast<uint16_t>(dest, value); return true;
        case TypeCat::Int32:    StoreCast<int32_t>(dest, value); return true;
        case TypeCat::UInt32:   StoreCast<uint32_t>(dest, value); return true;
        case TypeCat::Int64:    StoreCast<int64_t>(dest, value); return true;
        case TypeCat::UInt64:   StoreCast<uint64_t>(dest, value); return true;
        case TypeCat::Float:    StoreCast<float>(dest, value); return true;
        case TypeCat::Double:   StoreCast<double>(dest, value); return true;
        default:                return false;
        }
    }

    bool Cast(
        IteratorRange<void*> dest, TypeDesc destType,
        IteratorRange<const void*> src, TypeDesc srcType)
    {
        if (destType._type == TypeCat::Void || srcType._type == TypeCat::Void) return false;
        if (dest.size() < destType.GetSize() || src.size() < srcType.GetSize()) return false;

        auto* s = src.begin();
        switch (srcType._type) {
        case TypeCat::Bool:     return StoreCast(dest, destType._type, (uint32_t)LoadUnaligned<bool>(s));
        case TypeCat::Int8:     return StoreCast(dest, destType._type, LoadUnaligned<int8_t>(s));
        case TypeCat::UInt8:    return StoreCast(dest, destType._type, LoadUnaligned<uint8_t>(s));
        case TypeCat::Int16:    return StoreCast(dest, destType._type, LoadUnaligned<int16_t>(s));
        case TypeCat::UInt16:   return StoreCast(dest, destType._type, LoadUnaligned<uint16_t>(s));
        case TypeCat::Int32:    return StoreCast(dest, destType._type, LoadUnaligned<int32_t>(s));
        case TypeCat::UInt32:   return StoreCast(dest, destType._type, LoadUnaligned<uint32_t>(s));
        case TypeCat::Int64:    return StoreCast(dest, destType._type, LoadUnaligned<int64_t>(s));
        case TypeCat::UInt64:   return StoreCast(dest, destType._type, LoadUnaligned<uint64_t>(s));
        case TypeCat::Float:    return StoreCast(dest, destType._type, LoadUnaligned<float>(s));
        case TypeCat::Double:   return StoreCast(dest, destType._type, LoadUnaligned<double>(s));
        default:                return false;
        }
    }

    VariantRetained::VariantRetained(TypeDesc type, IteratorRange<const void*> data)
    : _type(type)
    {
        if (type.GetSize() > sizeof(_smallBuffer) || data.size() < type.GetSize())
            Throw(std::runtime_error("Invalid data size while constructing ImpliedTyping::VariantRetained"));
        std::memcpy(_smallBuffer, data.begin(), type.GetSize());
    }
}}
