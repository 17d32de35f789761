// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Variant.h"
#include "../OSServices/Log.h"

namespace BinLayout { namespace Internal
{
    void TraceRejectedCandidate(StringSection<> name, uint64_t position, const ReadError& error, const Context& ctx)
    {
        if (ctx.GetDiagnostics() & DiagnosticFlags::TraceVariants) {
            Log(Verbose) << "Rejected variant candidate (" << name.AsString() << ") at 0x" << std::hex << position << std::dec << ": " << error.what() << std::endl;
        } else {
            Log(Debug) << "Rejected variant candidate (" << name.AsString() << ") at 0x" << std::hex << position << std::dec << ": " << error.what() << std::endl;
        }
    }

    void ThrowVariantFailure(uint64_t position, VariantErrorMode mode, std::vector<VariantAttempt>&& attempts)
    {
        if (mode == VariantErrorMode::ReturnUnexpectedError)
            Throw(NoVariantMatch(position));
        Throw(EnumErrors(position, std::move(attempts)));
    }
}}
