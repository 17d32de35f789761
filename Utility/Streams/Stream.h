// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../IteratorUtils.h"
#include "../StringUtils.h"
#include <ostream>
#include <fstream>
#include <vector>
#include <stdexcept>

namespace Utility
{
    using OutputStream = std::ostream;

    /// <summary>Raised by input streams on read or seek failures</summary>
    class StreamError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// <summary>Seekable source of bytes</summary>
    /// Positions are byte offsets from the start of the stream. Seeking beyond the
    /// end of the stream is allowed (as with std::istream), but a subsequent read
    /// will then return no bytes. Seeking to a negative position raises StreamError.
    class IInputStream
    {
    public:
        /// <summary>Reads up to dst.size() bytes, returns the number of bytes read</summary>
        /// Returns fewer than requested only when the end of the stream is reached.
        virtual size_t Read(IteratorRange<void*> dst) = 0;
        virtual void SeekAbsolute(uint64_t position) = 0;
        virtual void SeekRelative(int64_t offset) = 0;
        virtual uint64_t TellPosition() const = 0;
        virtual ~IInputStream();
    };

    /// <summary>Reads from a block of memory</summary>
    /// Can either reference memory owned by the caller, or take ownership of a buffer
    class MemoryInputStream : public IInputStream
    {
    public:
        size_t Read(IteratorRange<void*> dst) override;
        void SeekAbsolute(uint64_t position) override;
        void SeekRelative(int64_t offset) override;
        uint64_t TellPosition() const override { return _position; }

        IteratorRange<const void*> GetData() const { return _data; }

        MemoryInputStream(IteratorRange<const void*> data);
        MemoryInputStream(std::vector<uint8_t>&& ownedData);
        MemoryInputStream(const MemoryInputStream&) = delete;
        MemoryInputStream& operator=(const MemoryInputStream&) = delete;
        ~MemoryInputStream();
    private:
        std::vector<uint8_t> _ownedData;
        IteratorRange<const void*> _data;
        uint64_t _position = 0;
    };

    class FileInputStream : public IInputStream
    {
    public:
        size_t Read(IteratorRange<void*> dst) override;
        void SeekAbsolute(uint64_t position) override;
        void SeekRelative(int64_t offset) override;
        uint64_t TellPosition() const override { return _position; }

        FileInputStream(StringSection<> filename);
        ~FileInputStream();
    private:
        std::ifstream _file;
        std::string _filename;
        uint64_t _position = 0;
    };

    /// <summary>Restricts reads from another stream to a window of bytes</summary>
    /// The window starts at the position of "underlying" when this is constructed and
    /// extends for "limit" bytes. Positions are still reported in the coordinates of
    /// the underlying stream, so file offsets read from the data remain meaningful.
    class LimitedInputStream : public IInputStream
    {
    public:
        size_t Read(IteratorRange<void*> dst) override;
        void SeekAbsolute(uint64_t position) override;
        void SeekRelative(int64_t offset) override;
        uint64_t TellPosition() const override;

        uint64_t GetWindowBegin() const { return _windowBegin; }
        uint64_t GetWindowEnd() const { return _windowEnd; }

        LimitedInputStream(IInputStream& underlying, uint64_t limit);
        ~LimitedInputStream();
    private:
        IInputStream* _underlying;
        uint64_t _windowBegin, _windowEnd;
    };
}

using namespace Utility;
