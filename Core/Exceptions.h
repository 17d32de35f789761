// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Prefix.h"
#include <exception>

    //
    //  Exception handling goes through these macros so that the code that raises
    //  and catches errors reads the same everywhere. Always raise with Throw()
    //  and catch with TRY { ... } CATCH(const Type& e) { ... } CATCH_END
    //
#define TRY             try
#define CATCH(x)        catch(x)
#define CATCH_END
#define RETHROW         throw

template<typename Type>
    [[noreturn]] inline void Throw(const Type& e)
{
    throw e;
}
