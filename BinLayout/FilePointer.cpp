// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "FilePointer.h"
#include "../Utility/StringFormat.h"
#include "../OSServices/Log.h"

namespace BinLayout { namespace Internal
{
    uint64_t CalculatePointerTarget(PointerMode mode, int64_t offset, bool offsetIsSigned, const Context& ctx)
    {
        uint64_t base = (mode == PointerMode::Relative) ? ctx.GetBaseOffset() : 0;
        if (!offsetIsSigned || offset >= 0)
            return base + uint64_t(offset);

        if (uint64_t(-offset) > base)
            Throw(IOError((StringMeld<256>() << "Pointer offset (" << offset << ") from base (" << base << ") refers to a position before the start of the stream").AsString()));
        return base - uint64_t(-offset);
    }

    void TracePointer(uint64_t from, uint64_t to, const Context& ctx)
    {
        auto name = ctx.Get<ContextKey::VariableName>();
        Log(Verbose) << "Following pointer " << (name.empty() ? std::string{"<unnamed>"} : name)
            << " from 0x" << std::hex << from << " to 0x" << to << std::dec << std::endl;
    }

    void ThrowUnresolvedPointer()
    {
        Throw(std::logic_error("Attempting to access the target of a file pointer before it has been resolved"));
    }
}}
