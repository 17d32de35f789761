// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Context.h"
#include "Errors.h"
#include "Primitives.h"
#include "StreamAccess.h"
#include "../OSServices/Log.h"
#include "../Core/Exceptions.h"
#include <array>
#include <tuple>
#include <utility>
#include <memory>
#include <optional>
#include <type_traits>

namespace BinLayout
{
    using Utility::IInputStream;

    /// <summary>Argument bundle for types that take no arguments</summary>
    struct NoArgs {};

    ///////////////////////////////////////////////////////////////////////////////////////////////
    //
    //  Reading is done in 2 phases:
    //
    //      Read()      consumes the value's own bytes at the current stream position.
    //                  Pointers only read their offset during this phase.
    //
    //      Resolve()   called after Read() has completed for the entire top level
    //                  value. Does deferred work (ie, following pointers). Resolve()
    //                  must leave the stream position where it found it.
    //
    //  ReadTraits<> is the customization point. Records implement it by providing:
    //
    //      using ReadArgs = ...;
    //      static Type Read(IInputStream&, const Context&, const ReadArgs&);
    //      void Resolve(IInputStream&, const Context&, const ReadArgs&);       (optional)
    //
    //  Other types can specialize ReadTraits<> directly.
    //
    ///////////////////////////////////////////////////////////////////////////////////////////////

    namespace Internal
    {
        template<typename Type, typename=void> struct HasResolveMember : std::false_type {};
        template<typename Type>
            struct HasResolveMember<Type, std::void_t<decltype(std::declval<Type&>().Resolve(std::declval<IInputStream&>(), std::declval<const Context&>(), std::declval<const typename Type::ReadArgs&>()))>>
            : std::true_type {};
    }

    template<typename Type, typename Enable=void>
        struct ReadTraits
    {
        using Args = typename Type::ReadArgs;

        static Type Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return Type::Read(stream, ctx, args);
        }

        static void Resolve(Type& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            if constexpr (Internal::HasResolveMember<Type>::value)
                value.Resolve(stream, ctx, args);
        }
    };

    template<typename Type> using ReadArgsOf = typename ReadTraits<Type>::Args;
    template<typename Type> constexpr bool HasDefaultArgs = std::is_same_v<ReadArgsOf<Type>, NoArgs>;

    template<typename Type>
        Type Read(IInputStream& stream, const Context& ctx, const ReadArgsOf<Type>& args)
    {
        return ReadTraits<Type>::Read(stream, ctx, args);
    }

    template<typename Type>
        Type Read(IInputStream& stream, const Context& ctx)
    {
        static_assert(HasDefaultArgs<Type>, "This type requires arguments. Use the overload of Read() that takes an argument bundle");
        return ReadTraits<Type>::Read(stream, ctx, NoArgs{});
    }

    template<typename Type>
        void Resolve(Type& value, IInputStream& stream, const Context& ctx, const ReadArgsOf<Type>& args)
    {
        ReadTraits<Type>::Resolve(value, stream, ctx, args);
    }

    template<typename Type>
        void Resolve(Type& value, IInputStream& stream, const Context& ctx)
    {
        static_assert(std::is_default_constructible_v<ReadArgsOf<Type>>, "Resolve() without arguments requires a default constructible argument bundle");
        ReadTraits<Type>::Resolve(value, stream, ctx, ReadArgsOf<Type>{});
    }

    /// <summary>Resolve a list of members in order, each with default arguments</summary>
    /// Convenient for implementing Resolve() on records.
    template<typename... Members>
        void ResolveAll(IInputStream& stream, const Context& ctx, Members&... members)
    {
        (BinLayout::Resolve(members, stream, ctx), ...);
    }

    /// <summary>Read a value and then immediately resolve it</summary>
    template<typename Type>
        Type ReadAndResolve(IInputStream& stream, const Context& ctx, const ReadArgsOf<Type>& args)
    {
        Type result = BinLayout::Read<Type>(stream, ctx, args);
        BinLayout::Resolve(result, stream, ctx, args);
        return result;
    }

///////////////////////////////////////////////////////////////////////////////////////////////////
    //      Primitives
///////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename Type>
        struct ReadTraits<Type, std::enable_if_t<Internal::IsPrimitive<Type>>>
    {
        using Args = NoArgs;

        static Type Read(IInputStream& stream, const Context& ctx, const Args&)
        {
            if (!ctx.IsTracing())
                return DecodePrimitive<Type>(stream, ctx.GetByteOrder());

            auto position = TellPosition(stream);
            auto result = DecodePrimitive<Type>(stream, ctx.GetByteOrder());
            Internal::TracePrimitive(position, ctx, MakeOpaqueIteratorRange(result), Internal::DescribePrimitive<Type>());
            return result;
        }

        static void Resolve(Type&, IInputStream&, const Context&, const Args&) {}
    };

///////////////////////////////////////////////////////////////////////////////////////////////////
    //      Fixed size arrays & tuples
///////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename Element, size_t Count>
        struct ReadTraits<std::array<Element, Count>>
    {
        using Args = ReadArgsOf<Element>;

        static std::array<Element, Count> Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return ReadElements(stream, ctx, args, std::make_index_sequence<Count>{});
        }

        static void Resolve(std::array<Element, Count>& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            for (auto& e:value)
                BinLayout::Resolve(e, stream, ctx, args);
        }

    private:
        template<size_t... Indices>
            static std::array<Element, Count> ReadElements(IInputStream& stream, const Context& ctx, const Args& args, std::index_sequence<Indices...>)
        {
                // elements of a braced initializer list are evaluated in order
            return { ((void)Indices, BinLayout::Read<Element>(stream, ctx, args))... };
        }
    };

    template<typename... Elements>
        struct ReadTraits<std::tuple<Elements...>>
    {
        static_assert((HasDefaultArgs<Elements> && ...), "Every element of a tuple must be readable without arguments");
        using Args = NoArgs;

        static std::tuple<Elements...> Read(IInputStream& stream, const Context& ctx, const Args&)
        {
            return std::tuple<Elements...>{ BinLayout::Read<Elements>(stream, ctx)... };
        }

        static void Resolve(std::tuple<Elements...>& value, IInputStream& stream, const Context& ctx, const Args&)
        {
            std::apply([&](auto&... e) { ResolveAll(stream, ctx, e...); }, value);
        }
    };

    template<typename First, typename Second>
        struct ReadTraits<std::pair<First, Second>>
    {
        static_assert(HasDefaultArgs<First> && HasDefaultArgs<Second>, "Both elements of a pair must be readable without arguments");
        using Args = NoArgs;

        static std::pair<First, Second> Read(IInputStream& stream, const Context& ctx, const Args&)
        {
            return std::pair<First, Second>{ BinLayout::Read<First>(stream, ctx), BinLayout::Read<Second>(stream, ctx) };
        }

        static void Resolve(std::pair<First, Second>& value, IInputStream& stream, const Context& ctx, const Args&)
        {
            ResolveAll(stream, ctx, value.first, value.second);
        }
    };

///////////////////////////////////////////////////////////////////////////////////////////////////
    //      Boxes & optionals
///////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename Type>
        struct ReadTraits<std::unique_ptr<Type>>
    {
        using Args = ReadArgsOf<Type>;

        static std::unique_ptr<Type> Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return std::make_unique<Type>(BinLayout::Read<Type>(stream, ctx, args));
        }

        static void Resolve(std::unique_ptr<Type>& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            if (value)
                BinLayout::Resolve(*value, stream, ctx, args);
        }
    };

    /// <summary>Attempt to read a value; on failure, rewind and produce an empty optional</summary>
    /// Only failures raised while reading (ReadError) are treated as "not present". Other
    /// exceptions propagate.
    template<typename Type>
        struct ReadTraits<std::optional<Type>>
    {
        using Args = ReadArgsOf<Type>;

        static std::optional<Type> Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            auto position = TellPosition(stream);
            TRY {
                return BinLayout::Read<Type>(stream, ctx, args);
            } CATCH(const ReadError& e) {
                Log(Debug) << "Optional value not present at 0x" << std::hex << position << std::dec << " (" << e.what() << ")" << std::endl;
            } CATCH_END
            SeekTo(stream, position);
            return {};
        }

        static void Resolve(std::optional<Type>& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            if (value)
                BinLayout::Resolve(*value, stream, ctx, args);
        }
    };
}
