// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "ReadTraits.h"
#include <string>

namespace BinLayout
{
    /// <summary>A string of 8 bit characters terminated by a zero byte</summary>
    /// The terminator is consumed but not stored. A stream that ends before the
    /// terminator raises IOError.
    class NullString
    {
    public:
        using ReadArgs = NoArgs;
        static NullString Read(IInputStream& stream, const Context& ctx, const NoArgs&);

        std::string _value;

        const std::string& AsString() const { return _value; }
        operator StringSection<>() const { return MakeStringSection(_value); }
    };

    /// <summary>A string of 16 bit code units terminated by a zero code unit</summary>
    /// Code units are decoded with the byte order from the Context.
    class NullWideString
    {
    public:
        using ReadArgs = NoArgs;
        static NullWideString Read(IInputStream& stream, const Context& ctx, const NoArgs&);

        std::u16string _value;

        /// <summary>Convert to UTF-8. Unpaired surrogates become U+FFFD</summary>
        std::string AsUTF8() const;
    };

    bool operator==(const NullString& lhs, StringSection<> rhs);
}
