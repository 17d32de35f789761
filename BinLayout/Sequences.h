// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "ReadTraits.h"
#include <vector>
#include <algorithm>

namespace BinLayout
{
    /// <summary>Arguments for counted sequences (std::vector<> and Counted<>)</summary>
    /// When _count is empty, the DeclaredCount from the Context is used instead.
    template<typename ElementArgs = NoArgs>
        class CountedArgs
    {
    public:
        std::optional<size_t> _count;
        ElementArgs _elementArgs = {};

        CountedArgs() = default;
        explicit CountedArgs(size_t count, ElementArgs elementArgs = ElementArgs{}) : _count(count), _elementArgs(std::move(elementArgs)) {}
    };

    namespace Internal
    {
        size_t ResolveCount(IInputStream& stream, const Context& ctx, std::optional<size_t> count);
        std::vector<uint8_t> ReadByteRun(IInputStream& stream, size_t count);
    }

    /// <summary>Read exactly "count" elements, in order</summary>
    /// Fails on the first element that fails; never returns a partial sequence.
    template<typename Element>
        std::vector<Element> ReadCounted(IInputStream& stream, const Context& ctx, const CountedArgs<ReadArgsOf<Element>>& args)
    {
        auto count = Internal::ResolveCount(stream, ctx, args._count);

        if constexpr (sizeof(Element) == 1 && Internal::IsPrimitive<Element>) {
            if (!ctx.IsTracing()) {
                auto bytes = Internal::ReadByteRun(stream, count);
                return std::vector<Element>((const Element*)bytes.data(), (const Element*)(bytes.data() + bytes.size()));
            }
        }

        std::vector<Element> result;
            // the count comes from the data; so don't trust it for preallocation
        result.reserve(std::min(count, size_t(4096)));
        for (size_t c=0; c<count; ++c)
            result.push_back(BinLayout::Read<Element>(stream, ctx, args._elementArgs));
        return result;
    }

    template<typename Element, typename ElementArgs>
        void ResolveElements(std::vector<Element>& elements, IInputStream& stream, const Context& ctx, const ElementArgs& args)
    {
        for (auto& e:elements)
            BinLayout::Resolve(e, stream, ctx, args);
    }

    template<typename Element>
        struct ReadTraits<std::vector<Element>>
    {
        using Args = CountedArgs<ReadArgsOf<Element>>;

        static std::vector<Element> Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return ReadCounted<Element>(stream, ctx, args);
        }

        static void Resolve(std::vector<Element>& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            ResolveElements(value, stream, ctx, args._elementArgs);
        }
    };

    /// <summary>A sequence with a count given by arguments (or by the Context)</summary>
    template<typename Element>
        class Counted
    {
    public:
        using ReadArgs = CountedArgs<ReadArgsOf<Element>>;

        static Counted Read(IInputStream& stream, const Context& ctx, const ReadArgs& args)
        {
            Counted result;
            result._data = ReadCounted<Element>(stream, ctx, args);
            return result;
        }

        void Resolve(IInputStream& stream, const Context& ctx, const ReadArgs& args)
        {
            ResolveElements(_data, stream, ctx, args._elementArgs);
        }

        const std::vector<Element>& operator*() const { return _data; }
        std::vector<Element>& operator*() { return _data; }
        const std::vector<Element>* operator->() const { return &_data; }
        std::vector<Element>* operator->() { return &_data; }
        std::vector<Element> IntoValues() && { return std::move(_data); }

    private:
        std::vector<Element> _data;
    };

///////////////////////////////////////////////////////////////////////////////////////////////////

    enum class Punctuation
    {
        Separated,              ///< element, separator, element, ... element
        SeparatedTrailing       ///< element, separator, ... element, separator
    };

    template<typename ElementArgs = NoArgs>
        class PunctuatedArgs
    {
    public:
        Punctuation _punctuation;
        size_t _count;
        ElementArgs _elementArgs;

            // (no default constructor; the punctuation must always be chosen explicitly)
        PunctuatedArgs(Punctuation punctuation, size_t count, ElementArgs elementArgs = ElementArgs{})
        : _punctuation(punctuation), _count(count), _elementArgs(std::move(elementArgs)) {}
    };

    /// <summary>A sequence of elements interleaved with separators</summary>
    /// Use Punctuated::Separated() or Punctuated::SeparatedTrailing() to read; or read
    /// as a field with PunctuatedArgs. There is no default; the layout must be selected
    /// explicitly. Separators are read with default arguments.
    template<typename Element, typename Separator>
        class Punctuated
    {
    public:
        static_assert(HasDefaultArgs<Separator>, "Separators must be readable without arguments");
        using ReadArgs = PunctuatedArgs<ReadArgsOf<Element>>;

        std::vector<Element> _data;
        std::vector<Separator> _separators;

        static Punctuated Separated(IInputStream& stream, const Context& ctx, size_t count, const ReadArgsOf<Element>& elementArgs)
        {
            Punctuated result;
            result._data.reserve(std::min(count, size_t(4096)));
            if (count == 0) return result;
            result._separators.reserve(std::min(count - 1, size_t(4096)));

            result._data.push_back(BinLayout::Read<Element>(stream, ctx, elementArgs));
            for (size_t c=1; c<count; ++c) {
                result._separators.push_back(BinLayout::Read<Separator>(stream, ctx));
                result._data.push_back(BinLayout::Read<Element>(stream, ctx, elementArgs));
            }
            return result;
        }

        static Punctuated SeparatedTrailing(IInputStream& stream, const Context& ctx, size_t count, const ReadArgsOf<Element>& elementArgs)
        {
            Punctuated result;
            result._data.reserve(std::min(count, size_t(4096)));
            result._separators.reserve(std::min(count, size_t(4096)));
            for (size_t c=0; c<count; ++c) {
                result._data.push_back(BinLayout::Read<Element>(stream, ctx, elementArgs));
                result._separators.push_back(BinLayout::Read<Separator>(stream, ctx));
            }
            return result;
        }

        static Punctuated Separated(IInputStream& stream, const Context& ctx, size_t count)
        {
            static_assert(HasDefaultArgs<Element>, "This element type requires arguments");
            return Separated(stream, ctx, count, NoArgs{});
        }

        static Punctuated SeparatedTrailing(IInputStream& stream, const Context& ctx, size_t count)
        {
            static_assert(HasDefaultArgs<Element>, "This element type requires arguments");
            return SeparatedTrailing(stream, ctx, count, NoArgs{});
        }

        static Punctuated Read(IInputStream& stream, const Context& ctx, const ReadArgs& args)
        {
            if (args._punctuation == Punctuation::Separated)
                return Separated(stream, ctx, args._count, args._elementArgs);
            return SeparatedTrailing(stream, ctx, args._count, args._elementArgs);
        }

        void Resolve(IInputStream& stream, const Context& ctx, const ReadArgs& args)
        {
            ResolveElements(_data, stream, ctx, args._elementArgs);
            ResolveElements(_separators, stream, ctx, NoArgs{});
        }

        std::vector<Element> IntoValues() && { return std::move(_data); }
    };

    /// <summary>Read a run of raw bytes in one operation</summary>
    inline std::vector<uint8_t> ReadBytes(IInputStream& stream, size_t count)
    {
        return Internal::ReadByteRun(stream, count);
    }
}
