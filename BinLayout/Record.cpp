// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Record.h"
#include "../Utility/BitUtils.h"
#include "../OSServices/Log.h"
#include <vector>
#include <cstring>

namespace BinLayout
{
    Context RecordReader::MakeFieldContext(StringSection<> name, const FieldOptions& options) const
    {
        Context result = _context;
        if (options._byteOrder) result = result.WithByteOrder(*options._byteOrder);
        if (options._baseOffset) result = result.WithBaseOffset(*options._baseOffset);
        if (options._count) result = result.WithDeclaredCount(*options._count);
            // variable names are only needed for diagnostics
        if (result.GetDiagnostics() != 0)
            result = result.With<ContextKey::VariableName>(name.AsString());
        return result;
    }

    void RecordReader::MagicBytes(IteratorRange<const void*> expected)
    {
        auto position = GetPosition();
        std::vector<uint8_t> found(expected.size());
        ReadExact(*_stream, IteratorRange<void*>(found.data(), found.data() + found.size()));
        if (std::memcmp(found.data(), expected.begin(), found.size()) != 0)
            Throw(BadMagic(position, IteratorRange<const void*>(found.data(), found.data() + found.size())));
    }

    void RecordReader::MagicBytes(const char expected[])
    {
        MagicBytes(IteratorRange<const void*>(expected, expected + std::strlen(expected)));
    }

    void RecordReader::Assert(bool condition, StringSection<> message) const
    {
        if (!condition)
            Throw(AssertionFailure(_startPosition, message.AsString()));
    }

    void RecordReader::Fail(StringSection<> message) const
    {
        Throw(CustomError(_startPosition, message.AsString()));
    }

    void RecordReader::AlignTo(uint64_t alignment)
    {
        if (alignment == 0)
            Throw(std::invalid_argument("Alignment must be non-zero in RecordReader::AlignTo"));
        auto position = GetPosition();
        auto aligned = CeilToMultiple(position, alignment);
        if (aligned != position)
            BinLayout::SeekTo(*_stream, aligned);
    }

    void RecordReader::Skip(int64_t byteCount)
    {
        SeekBy(*_stream, byteCount);
    }

    void RecordReader::SeekTo(uint64_t position)
    {
        BinLayout::SeekTo(*_stream, position);
    }

    uint64_t RecordReader::GetPosition() const
    {
        return TellPosition(*_stream);
    }

    RecordReader::RecordReader(IInputStream& stream, const Context& ctx, const char recordName[])
    : _stream(&stream), _context(ctx), _recordName(recordName)
    {
        _startPosition = TellPosition(stream);
        if (ctx.IsTracing())
            Log(Verbose) << "Reading record (" << (_recordName ? _recordName : "<unnamed>") << ") at 0x" << std::hex << _startPosition << std::dec << std::endl;
    }

    RecordReader::~RecordReader() = default;
}
