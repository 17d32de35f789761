// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Stream.h"
#include "../StringFormat.h"
#include "../../Core/Exceptions.h"
#include <algorithm>
#include <cstring>

namespace Utility
{
    IInputStream::~IInputStream() = default;

    static uint64_t ApplyRelativeOffset(uint64_t position, int64_t offset)
    {
        if (offset < 0 && uint64_t(-offset) > position)
            Throw(StreamError((StringMeld<256>() << "Attempting to seek to negative position (" << position << " + " << offset << ")").AsString()));
        return position + offset;
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    size_t MemoryInputStream::Read(IteratorRange<void*> dst)
    {
        auto size = uint64_t(_data.size());
        if (_position >= size) return 0;
        auto toCopy = (size_t)std::min(uint64_t(dst.size()), size - _position);
        std::memcpy(dst.begin(), PtrAdd(_data.begin(), ptrdiff_t(_position)), toCopy);
        _position += toCopy;
        return toCopy;
    }

    void MemoryInputStream::SeekAbsolute(uint64_t position)
    {
        _position = position;
    }

    void MemoryInputStream::SeekRelative(int64_t offset)
    {
        _position = ApplyRelativeOffset(_position, offset);
    }

    MemoryInputStream::MemoryInputStream(IteratorRange<const void*> data)
    : _data(data)
    {}

    MemoryInputStream::MemoryInputStream(std::vector<uint8_t>&& ownedData)
    : _ownedData(std::move(ownedData))
    {
        _data = { _ownedData.data(), _ownedData.data() + _ownedData.size() };
    }

    MemoryInputStream::~MemoryInputStream() = default;

///////////////////////////////////////////////////////////////////////////////////////////////////

    size_t FileInputStream::Read(IteratorRange<void*> dst)
    {
        if (dst.empty()) return 0;
        _file.clear();
        _file.seekg(std::streamoff(_position));
        _file.read((char*)dst.begin(), std::streamsize(dst.size()));
        auto count = _file.gcount();
        if (_file.bad())
            Throw(StreamError("Read failure on file (" + _filename + ")"));
        _position += uint64_t(count);
        return size_t(count);
    }

    void FileInputStream::SeekAbsolute(uint64_t position)
    {
            // (the underlying file is repositioned lazily, at the next read)
        _position = position;
    }

    void FileInputStream::SeekRelative(int64_t offset)
    {
        _position = ApplyRelativeOffset(_position, offset);
    }

    FileInputStream::FileInputStream(StringSection<> filename)
    : _filename(filename.AsString())
    {
        _file.open(_filename, std::ios::in | std::ios::binary);
        if (!_file.is_open())
            Throw(StreamError("Could not open file (" + _filename + ") for reading"));
    }

    FileInputStream::~FileInputStream() = default;

///////////////////////////////////////////////////////////////////////////////////////////////////

    size_t LimitedInputStream::Read(IteratorRange<void*> dst)
    {
        auto position = _underlying->TellPosition();
        if (position >= _windowEnd || position < _windowBegin) return 0;
        auto allowed = (size_t)std::min(uint64_t(dst.size()), _windowEnd - position);
        return _underlying->Read({dst.begin(), PtrAdd(dst.begin(), ptrdiff_t(allowed))});
    }

    void LimitedInputStream::SeekAbsolute(uint64_t position)
    {
        _underlying->SeekAbsolute(position);
    }

    void LimitedInputStream::SeekRelative(int64_t offset)
    {
        _underlying->SeekRelative(offset);
    }

    uint64_t LimitedInputStream::TellPosition() const
    {
        return _underlying->TellPosition();
    }

    LimitedInputStream::LimitedInputStream(IInputStream& underlying, uint64_t limit)
    : _underlying(&underlying)
    {
        _windowBegin = underlying.TellPosition();
        _windowEnd = _windowBegin + limit;
    }

    LimitedInputStream::~LimitedInputStream() = default;
}
