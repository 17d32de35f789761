// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include <cstdint>
#include <cstddef>

    //  Host byte order. We only need to know if the host is big or little endian;
    //  mixed endian platforms are not supported.
#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
    #define BINLAYOUT_HOST_BIG_ENDIAN 1
    #define BINLAYOUT_HOST_LITTLE_ENDIAN 0
#elif defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
    #define BINLAYOUT_HOST_BIG_ENDIAN 0
    #define BINLAYOUT_HOST_LITTLE_ENDIAN 1
#elif defined(_MSC_VER)
    #define BINLAYOUT_HOST_BIG_ENDIAN 0
    #define BINLAYOUT_HOST_LITTLE_ENDIAN 1
#else
    #error Could not determine host byte order
#endif
