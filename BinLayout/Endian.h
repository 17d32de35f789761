// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Prefix.h"
#include <optional>

namespace Utility { class IInputStream; }

namespace BinLayout
{
    class Context;

    /// <summary>Byte order used to decode multi-byte primitives</summary>
    /// Native means whatever the host uses, resolved at the point of decoding.
    enum class Endian { Big, Little, Native };

    constexpr Endian GetHostEndian()
    {
        #if BINLAYOUT_HOST_BIG_ENDIAN
            return Endian::Big;
        #else
            return Endian::Little;
        #endif
    }

    /// <summary>Collapses Native into either Big or Little</summary>
    constexpr Endian ResolveNative(Endian endian)
    {
        return (endian == Endian::Native) ? GetHostEndian() : endian;
    }

    constexpr bool RequiresByteSwap(Endian endian)
    {
        return ResolveNative(endian) != GetHostEndian();
    }

    const char* AsString(Endian);

    constexpr uint16_t ByteOrderMark = 0xfeff;

    /// <summary>Interpret a 16 bit byte order mark that was decoded as big endian</summary>
    std::optional<Endian> FromBigEndianBOM(uint16_t bom);

    /// <summary>Interpret a 16 bit byte order mark that was decoded as little endian</summary>
    std::optional<Endian> FromLittleEndianBOM(uint16_t bom);

    /// <summary>Read a 16 bit byte order mark and return the byte order it specifies</summary>
    /// The mark is always read as big endian: "FE FF" selects Big, "FF FE" selects Little.
    /// Anything else raises BadMagic at the position of the mark.
    Endian ParseByteOrderMark(Utility::IInputStream& stream, const Context& ctx);
}
