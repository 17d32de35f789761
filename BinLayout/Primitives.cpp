// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Primitives.h"
#include "Context.h"
#include "../OSServices/Log.h"
#include <iomanip>

namespace BinLayout { namespace Internal
{
    void TracePrimitive(uint64_t position, const Context& ctx, IteratorRange<const void*> value, ImpliedTyping::TypeDesc type)
    {
        auto name = ctx.Get<ContextKey::VariableName>();
        Log(Verbose)
            << "0x" << std::hex << std::setw(8) << std::setfill('0') << position << std::dec << std::setfill(' ')
            << " " << ImpliedTyping::AsString(type._type)
            << " (" << AsString(ResolveNative(ctx.GetByteOrder())) << ") "
            << (name.empty() ? std::string{"<unnamed>"} : name)
            << " = " << ImpliedTyping::AsString(value, type)
            << std::endl;
    }
}}
