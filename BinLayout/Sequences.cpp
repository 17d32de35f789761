// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Sequences.h"

namespace BinLayout { namespace Internal
{
    size_t ResolveCount(IInputStream& stream, const Context& ctx, std::optional<size_t> count)
    {
        if (count) return *count;
        if (auto declared = ctx.GetDeclaredCount()) return *declared;
        Throw(CustomError(TellPosition(stream), "No element count was given for a counted sequence"));
    }

    std::vector<uint8_t> ReadByteRun(IInputStream& stream, size_t count)
    {
            // read in blocks, so a corrupt count fails on the stream rather than on a huge allocation
        const size_t blockSize = 64*1024;
        std::vector<uint8_t> result;
        while (result.size() < count) {
            auto chunk = std::min(blockSize, count - result.size());
            auto start = result.size();
            result.resize(start + chunk);
            ReadExact(stream, IteratorRange<void*>(result.data() + start, result.data() + start + chunk));
        }
        return result;
    }
}}
