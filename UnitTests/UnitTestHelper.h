// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../ConsoleRig/GlobalServices.h"
#include "../Utility/Streams/Stream.h"
#include <vector>
#include <initializer_list>

namespace UnitTests
{
    inline ConsoleRig::StartupConfig GetStartupConfig()
    {
        ConsoleRig::StartupConfig cfg = "binlayout-unit-tests";
            // quieten the runtime's own diagnostics unless a test asks for them
        cfg._logConfig = "Debug=disabled\nVerbose=disabled";
        return cfg;
    }

    inline MemoryInputStream MakeStream(std::initializer_list<uint8_t> bytes)
    {
        return MemoryInputStream(std::vector<uint8_t>(bytes));
    }
}
