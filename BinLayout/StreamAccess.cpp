// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "StreamAccess.h"
#include "Errors.h"
#include "../Utility/StringFormat.h"
#include "../Core/Exceptions.h"

namespace BinLayout
{
    uint64_t TellPosition(Utility::IInputStream& stream)
    {
        TRY {
            return stream.TellPosition();
        } CATCH(const Utility::StreamError& e) {
            Throw(IOError(e.what()));
        } CATCH_END
    }

    void SeekTo(Utility::IInputStream& stream, uint64_t position)
    {
        TRY {
            stream.SeekAbsolute(position);
        } CATCH(const Utility::StreamError& e) {
            Throw(IOError(e.what()));
        } CATCH_END
    }

    void SeekBy(Utility::IInputStream& stream, int64_t offset)
    {
        TRY {
            stream.SeekRelative(offset);
        } CATCH(const Utility::StreamError& e) {
            Throw(IOError(e.what()));
        } CATCH_END
    }

    void ReadExact(Utility::IInputStream& stream, IteratorRange<void*> dst)
    {
        size_t readCount = 0;
        TRY {
            readCount = stream.Read(dst);
        } CATCH(const Utility::StreamError& e) {
            Throw(IOError(e.what()));
        } CATCH_END
        if (readCount != dst.size())
            Throw(IOError((StringMeld<256>() << "Unexpected end of stream (wanted " << dst.size() << " bytes, got " << readCount << ")").AsString()));
    }
}
