// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/Streams/Stream.h"
#include "../Utility/IteratorUtils.h"

namespace BinLayout
{
    //
    //  Stream operations used by the runtime. These are thin wrappers over
    //  Utility::IInputStream that convert stream failures into IOError, and
    //  treat a short read as a failure.
    //
    uint64_t TellPosition(Utility::IInputStream& stream);
    void SeekTo(Utility::IInputStream& stream, uint64_t position);
    void SeekBy(Utility::IInputStream& stream, int64_t offset);
    void ReadExact(Utility::IInputStream& stream, IteratorRange<void*> dst);
}
