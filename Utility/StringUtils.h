// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "IteratorUtils.h"
#include <string>
#include <cstring>
#include <cctype>

namespace Utility
{
    /// <summary>Non-owning view of a run of characters</summary>
    /// Not necessarily null terminated. Prefer this for string parameters,
    /// so callers can pass literals, std::strings and sub-ranges without copies.
    template<typename CharType=char>
        class StringSection : public IteratorRange<const CharType*>
    {
    public:
        size_t Length() const       { return this->size(); }
        bool IsEmpty() const        { return this->first == this->second; }
        std::basic_string<CharType> AsString() const { return std::basic_string<CharType>(this->first, this->second); }

        StringSection() : IteratorRange<const CharType*>(nullptr, nullptr) {}
        StringSection(const CharType* start, const CharType* end) : IteratorRange<const CharType*>(start, end) {}
        StringSection(const CharType* nullTerm) : IteratorRange<const CharType*>(nullTerm, nullTerm + std::char_traits<CharType>::length(nullTerm)) {}
        StringSection(const std::basic_string<CharType>& str) : IteratorRange<const CharType*>(str.data(), str.data() + str.size()) {}
        StringSection(std::nullptr_t) = delete;
    };

    template<typename CharType>
        StringSection<CharType> MakeStringSection(const CharType* start, const CharType* end) { return StringSection<CharType>(start, end); }

    template<typename CharType>
        StringSection<CharType> MakeStringSection(const std::basic_string<CharType>& str) { return StringSection<CharType>(str); }

    inline StringSection<> MakeStringSection(const char* nullTerm) { return StringSection<>(nullTerm); }

    template<typename CharType>
        bool XlEqString(StringSection<CharType> lhs, StringSection<CharType> rhs)
    {
        if (lhs.Length() != rhs.Length()) return false;
        return std::char_traits<CharType>::compare(lhs.begin(), rhs.begin(), lhs.Length()) == 0;
    }

    inline bool XlEqString(StringSection<> lhs, const char* rhs) { return XlEqString(lhs, StringSection<>(rhs)); }

    inline bool XlEqStringI(StringSection<> lhs, StringSection<> rhs)
    {
        if (lhs.Length() != rhs.Length()) return false;
        for (size_t c=0; c<lhs.Length(); ++c)
            if (std::tolower((unsigned char)lhs[c]) != std::tolower((unsigned char)rhs[c]))
                return false;
        return true;
    }

    inline StringSection<> StripWhitespace(StringSection<> input)
    {
        auto b = input.begin(), e = input.end();
        while (b != e && (*b == ' ' || *b == '\t' || *b == '\r' || *b == '\n')) ++b;
        while (e != b && (*(e-1) == ' ' || *(e-1) == '\t' || *(e-1) == '\r' || *(e-1) == '\n')) --e;
        return { b, e };
    }
}

using namespace Utility;
