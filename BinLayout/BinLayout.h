// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Context.h"
#include "Errors.h"
#include "ReadTraits.h"
#include "Record.h"
#include "FilePointer.h"
#include "Sequences.h"
#include "Strings.h"
#include "Variant.h"

namespace BinLayout
{
    //
    //  Top level entry points. These run both phases: the whole value is read, and
    //  then resolved. On return the stream is positioned directly after the value's
    //  own bytes (resolving pointers never moves the stream).
    //

    template<typename Type>
        Type ReadValueWithContext(IInputStream& stream, const Context& ctx, const ReadArgsOf<Type>& args)
    {
        return ReadAndResolve<Type>(stream, ctx, args);
    }

    template<typename Type>
        Type ReadValueWithArgs(IInputStream& stream, const ReadArgsOf<Type>& args, Endian byteOrder = Endian::Native)
    {
        return ReadAndResolve<Type>(stream, Context{byteOrder}, args);
    }

    template<typename Type>
        Type ReadValue(IInputStream& stream, Endian byteOrder = Endian::Native)
    {
        static_assert(HasDefaultArgs<Type>, "This type requires arguments. Use ReadValueWithArgs()");
        return ReadAndResolve<Type>(stream, Context{byteOrder}, NoArgs{});
    }

    template<typename Type> Type ReadBE(IInputStream& stream) { return ReadValue<Type>(stream, Endian::Big); }
    template<typename Type> Type ReadLE(IInputStream& stream) { return ReadValue<Type>(stream, Endian::Little); }
    template<typename Type> Type ReadNE(IInputStream& stream) { return ReadValue<Type>(stream, Endian::Native); }
    template<typename Type> Type ReadType(IInputStream& stream, Endian byteOrder) { return ReadValue<Type>(stream, byteOrder); }
}
