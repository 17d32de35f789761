// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Endian.h"
#include "Errors.h"
#include "ReadTraits.h"
#include "StreamAccess.h"

namespace BinLayout
{
    const char* AsString(Endian endian)
    {
        switch (endian) {
        case Endian::Big:       return "Big";
        case Endian::Little:    return "Little";
        case Endian::Native:    return "Native";
        default:                return "<<unknown>>";
        }
    }

    std::optional<Endian> FromBigEndianBOM(uint16_t bom)
    {
        if (bom == ByteOrderMark) return Endian::Big;
        if (bom == 0xfffe) return Endian::Little;
        return {};
    }

    std::optional<Endian> FromLittleEndianBOM(uint16_t bom)
    {
        if (bom == ByteOrderMark) return Endian::Little;
        if (bom == 0xfffe) return Endian::Big;
        return {};
    }

    Endian ParseByteOrderMark(Utility::IInputStream& stream, const Context& ctx)
    {
        auto pos = TellPosition(stream);
        auto bom = Read<uint16_t>(stream, ctx.WithByteOrder(Endian::Big));
        auto result = FromBigEndianBOM(bom);
        if (!result)
            Throw(BadMagic(pos, bom));
        return *result;
    }
}
