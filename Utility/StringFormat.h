// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "StringUtils.h"
#include <ostream>
#include <streambuf>

namespace Utility
{
    namespace Internal
    {
        template<typename CharType>
            class FixedMemoryBuffer : public std::basic_streambuf<CharType>
        {
        public:
            FixedMemoryBuffer(CharType* begin, CharType* end)
            {
                    // leave room for the null terminator
                this->setp(begin, end-1);
                *begin = CharType(0);
            }
            CharType* Cursor() const { return this->pptr(); }
        };
    }

    /// <summary>Formats a short string into a fixed size buffer</summary>
    /// Usage:
    /// <code>
    ///     Throw(std::runtime_error((StringMeld<256>() << "Bad value " << value).AsString()));
    /// </code>
    /// Output past the end of the buffer is silently dropped.
    template<int Count, typename CharType=char>
        class StringMeld
    {
    public:
        template<typename Type>
            const StringMeld& operator<<(const Type& type) const
        {
            _stream << type;
            return *this;
        }

        const StringMeld& operator<<(std::basic_ostream<CharType>& (*manipulator)(std::basic_ostream<CharType>&)) const
        {
            _stream << manipulator;
            return *this;
        }

        const CharType* get() const
        {
            *_buffer.Cursor() = CharType(0);
            return _storage;
        }
        operator const CharType*() const { return get(); }
        operator StringSection<CharType>() const { return AsStringSection(); }
        StringSection<CharType> AsStringSection() const { return { _storage, _buffer.Cursor() }; }
        std::basic_string<CharType> AsString() const { return { (const CharType*)_storage, (const CharType*)_buffer.Cursor() }; }

        StringMeld() : _buffer(_storage, &_storage[Count]), _stream(&_buffer) {}
        StringMeld(const StringMeld&) = delete;
        StringMeld& operator=(const StringMeld&) = delete;
    private:
        mutable CharType _storage[Count];
        mutable Internal::FixedMemoryBuffer<CharType> _buffer;
        mutable std::basic_ostream<CharType> _stream;
    };
}

using namespace Utility;
