// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Strings.h"
#include "../OSServices/Log.h"

namespace BinLayout
{
    NullString NullString::Read(IInputStream& stream, const Context& ctx, const NoArgs&)
    {
        auto position = TellPosition(stream);
        NullString result;
        for (;;) {
            auto c = DecodePrimitive<uint8_t>(stream, Endian::Native);
            if (!c) break;
            result._value.push_back(char(c));
        }
        if (ctx.IsTracing())
            Log(Verbose) << "0x" << std::hex << position << std::dec << " NullString " << ctx.Get<ContextKey::VariableName>() << " = \"" << result._value << "\"" << std::endl;
        return result;
    }

    NullWideString NullWideString::Read(IInputStream& stream, const Context& ctx, const NoArgs&)
    {
        auto position = TellPosition(stream);
        NullWideString result;
        for (;;) {
            auto c = DecodePrimitive<uint16_t>(stream, ctx.GetByteOrder());
            if (!c) break;
            result._value.push_back(char16_t(c));
        }
        if (ctx.IsTracing())
            Log(Verbose) << "0x" << std::hex << position << std::dec << " NullWideString " << ctx.Get<ContextKey::VariableName>() << " = \"" << result.AsUTF8() << "\"" << std::endl;
        return result;
    }

    static void AppendUTF8(std::string& dst, uint32_t codePoint)
    {
        if (codePoint < 0x80) {
            dst.push_back(char(codePoint));
        } else if (codePoint < 0x800) {
            dst.push_back(char(0xc0 | (codePoint >> 6)));
            dst.push_back(char(0x80 | (codePoint & 0x3f)));
        } else if (codePoint < 0x10000) {
            dst.push_back(char(0xe0 | (codePoint >> 12)));
            dst.push_back(char(0x80 | ((codePoint >> 6) & 0x3f)));
            dst.push_back(char(0x80 | (codePoint & 0x3f)));
        } else {
            dst.push_back(char(0xf0 | (codePoint >> 18)));
            dst.push_back(char(0x80 | ((codePoint >> 12) & 0x3f)));
            dst.push_back(char(0x80 | ((codePoint >> 6) & 0x3f)));
            dst.push_back(char(0x80 | (codePoint & 0x3f)));
        }
    }

    std::string NullWideString::AsUTF8() const
    {
        const uint32_t replacementCharacter = 0xfffd;
        std::string result;
        result.reserve(_value.size());
        for (size_t c=0; c<_value.size(); ++c) {
            uint32_t unit = _value[c];
            if (unit >= 0xd800 && unit < 0xdc00) {
                if ((c+1) < _value.size() && _value[c+1] >= 0xdc00 && _value[c+1] < 0xe000) {
                    uint32_t low = _value[c+1];
                    AppendUTF8(result, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
                    ++c;
                } else
                    AppendUTF8(result, replacementCharacter);
            } else if (unit >= 0xdc00 && unit < 0xe000) {
                AppendUTF8(result, replacementCharacter);
            } else
                AppendUTF8(result, unit);
        }
        return result;
    }

    bool operator==(const NullString& lhs, StringSection<> rhs)
    {
        return XlEqString(MakeStringSection(lhs._value), rhs);
    }
}
