// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "ReadTraits.h"
#include <memory>
#include <optional>
#include <any>
#include <stdexcept>

namespace BinLayout
{
    enum class PointerMode
    {
        Absolute,       ///< offset is measured from the start of the stream
        Relative        ///< offset is measured from the BaseOffset in the Context
    };

    namespace Internal
    {
        uint64_t CalculatePointerTarget(PointerMode mode, int64_t offset, bool offsetIsSigned, const Context& ctx);
        void TracePointer(uint64_t from, uint64_t to, const Context& ctx);
        [[noreturn]] void ThrowUnresolvedPointer();

        /// <summary>Read (and resolve) a value at another position, then return to where we were</summary>
        template<typename Type>
            std::unique_ptr<Type> ReadAtOffset(IInputStream& stream, uint64_t target, const Context& ctx, const ReadArgsOf<Type>& args)
        {
            auto returnPosition = TellPosition(stream);
            if (ctx.IsTracing())
                TracePointer(returnPosition, target, ctx);
            SeekTo(stream, target);
            auto result = std::make_unique<Type>(BinLayout::Read<Type>(stream, ctx, args));
            BinLayout::Resolve(*result, stream, ctx, args);
            SeekTo(stream, returnPosition);
            return result;
        }
    }

    /// <summary>An offset in the stream, followed to read a value of type "Type"</summary>
    /// Read() only consumes the offset. The value is read during Resolve(), with the same
    /// Context and arguments that were used to read the offset (so byte order overrides
    /// and base offsets that applied to the pointer also apply to the value it points to).
    ///
    /// The offset may be a forward reference; so the value can't be accessed until after
    /// Resolve(). Accessing it earlier raises std::logic_error.
    ///
    /// "Type" may be incomplete where the pointer is declared, so a record can point to
    /// another instance of itself:
    /// <code>
    ///     struct ListNode
    ///     {
    ///         uint8_t _value;
    ///         AbsFilePtr8<std::unique_ptr<ListNode>> _next;
    ///         ...
    ///     };
    /// </code>
    /// For that reason the argument bundle type is only named inside member templates and
    /// in ReadTraits<FilePointer<>>; the captured arguments are held type erased.
    template<typename OffsetType, typename Type, PointerMode Mode>
        class FilePointer
    {
    public:
        static_assert(std::is_integral_v<OffsetType> && Internal::IsPrimitive<OffsetType>, "FilePointer offsets must be integers");

        template<typename Args>
            static FilePointer Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            static_assert(std::is_same_v<Args, ReadArgsOf<Type>>, "Pointer arguments must match the arguments of the target type");
            FilePointer result;
            result._offset = BinLayout::Read<OffsetType>(stream, ctx);
            result._readContext = ctx;
            result._readArgs = args;
            return result;
        }

        template<typename Args>
            void Resolve(IInputStream& stream, const Context& ctx, const Args& args)
        {
            static_assert(std::is_same_v<Args, ReadArgsOf<Type>>, "Pointer arguments must match the arguments of the target type");
            const Context& readContext = _readContext ? *_readContext : ctx;
            auto* capturedArgs = std::any_cast<Args>(&_readArgs);
            const Args& readArgs = capturedArgs ? *capturedArgs : args;
            auto target = Internal::CalculatePointerTarget(Mode, int64_t(_offset), std::is_signed_v<OffsetType>, readContext);
            _value = Internal::ReadAtOffset<Type>(stream, target, readContext, readArgs);
        }

        /// <summary>Read the offset and follow it immediately, returning just the value</summary>
        template<typename Args>
            static Type Parse(IInputStream& stream, const Context& ctx, const Args& args)
        {
            auto ptr = Read(stream, ctx, args);
            ptr.Resolve(stream, ctx, args);
            return std::move(*ptr._value);
        }

        static Type Parse(IInputStream& stream, const Context& ctx)
        {
            static_assert(HasDefaultArgs<Type>, "This pointer's target requires arguments");
            return Parse(stream, ctx, NoArgs{});
        }

        OffsetType GetOffset() const { return _offset; }
        bool IsResolved() const { return _value != nullptr; }

        Type& Get()                     { if (!_value) Internal::ThrowUnresolvedPointer(); return *_value; }
        const Type& Get() const         { if (!_value) Internal::ThrowUnresolvedPointer(); return *_value; }
        Type& operator*()               { return Get(); }
        const Type& operator*() const   { return Get(); }
        Type* operator->()              { return &Get(); }
        const Type* operator->() const  { return &Get(); }

        Type IntoInner() &&             { return std::move(Get()); }

        FilePointer() = default;
        FilePointer(FilePointer&&) = default;
        FilePointer& operator=(FilePointer&&) = default;
    private:
        OffsetType _offset = 0;
        std::unique_ptr<Type> _value;
        std::optional<Context> _readContext;
        std::any _readArgs;
    };

    template<typename OffsetType, typename Type, PointerMode Mode>
        struct ReadTraits<FilePointer<OffsetType, Type, Mode>>
    {
        using Args = ReadArgsOf<Type>;
        using Pointer = FilePointer<OffsetType, Type, Mode>;

        static Pointer Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return Pointer::Read(stream, ctx, args);
        }

        static void Resolve(Pointer& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            value.Resolve(stream, ctx, args);
        }
    };

    template<typename OffsetType, typename Type> using AbsFilePtr = FilePointer<OffsetType, Type, PointerMode::Absolute>;
    template<typename OffsetType, typename Type> using RelFilePtr = FilePointer<OffsetType, Type, PointerMode::Relative>;

    template<typename Type> using AbsFilePtr8 = AbsFilePtr<uint8_t, Type>;
    template<typename Type> using AbsFilePtr16 = AbsFilePtr<uint16_t, Type>;
    template<typename Type> using AbsFilePtr32 = AbsFilePtr<uint32_t, Type>;
    template<typename Type> using AbsFilePtr64 = AbsFilePtr<uint64_t, Type>;

    template<typename Type> using RelFilePtr8 = RelFilePtr<uint8_t, Type>;
    template<typename Type> using RelFilePtr16 = RelFilePtr<uint16_t, Type>;
    template<typename Type> using RelFilePtr32 = RelFilePtr<uint32_t, Type>;
    template<typename Type> using RelFilePtr64 = RelFilePtr<uint64_t, Type>;

///////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename TargetArgs = NoArgs>
        class PlacementArgs
    {
    public:
        uint64_t _offset;
        TargetArgs _targetArgs;

        PlacementArgs(uint64_t offset, TargetArgs targetArgs = TargetArgs{}) : _offset(offset), _targetArgs(std::move(targetArgs)) {}
    };

    /// <summary>A value at a known offset, that doesn't have a pointer stored in the stream</summary>
    /// Consumes nothing during Read(); the offset comes from the arguments and the value
    /// is read during Resolve(). Like FilePointer, "Type" may be incomplete where the
    /// placement is declared.
    template<typename Type, PointerMode Mode>
        class Placement
    {
    public:
        template<typename Args>
            static Placement Read(IInputStream&, const Context& ctx, const Args& args)
        {
            static_assert(std::is_same_v<Args, PlacementArgs<ReadArgsOf<Type>>>, "Placement arguments must wrap the arguments of the target type");
            Placement result;
            result._readContext = ctx;
            result._readArgs = args;
            return result;
        }

        template<typename Args>
            void Resolve(IInputStream& stream, const Context& ctx, const Args& args)
        {
            static_assert(std::is_same_v<Args, PlacementArgs<ReadArgsOf<Type>>>, "Placement arguments must wrap the arguments of the target type");
            const Context& readContext = _readContext ? *_readContext : ctx;
            auto* capturedArgs = std::any_cast<Args>(&_readArgs);
            const Args& readArgs = capturedArgs ? *capturedArgs : args;
            auto target = Internal::CalculatePointerTarget(Mode, int64_t(readArgs._offset), false, readContext);
            _value = Internal::ReadAtOffset<Type>(stream, target, readContext, readArgs._targetArgs);
        }

        bool IsResolved() const { return _value != nullptr; }
        Type& Get()                     { if (!_value) Internal::ThrowUnresolvedPointer(); return *_value; }
        const Type& Get() const         { if (!_value) Internal::ThrowUnresolvedPointer(); return *_value; }
        Type& operator*()               { return Get(); }
        const Type& operator*() const   { return Get(); }
        Type* operator->()              { return &Get(); }
        const Type* operator->() const  { return &Get(); }

        Placement() = default;
        Placement(Placement&&) = default;
        Placement& operator=(Placement&&) = default;
    private:
        std::unique_ptr<Type> _value;
        std::optional<Context> _readContext;
        std::any _readArgs;
    };

    template<typename Type, PointerMode Mode>
        struct ReadTraits<Placement<Type, Mode>>
    {
        using Args = PlacementArgs<ReadArgsOf<Type>>;

        static Placement<Type, Mode> Read(IInputStream& stream, const Context& ctx, const Args& args)
        {
            return Placement<Type, Mode>::Read(stream, ctx, args);
        }

        static void Resolve(Placement<Type, Mode>& value, IInputStream& stream, const Context& ctx, const Args& args)
        {
            value.Resolve(stream, ctx, args);
        }
    };

    template<typename Type> using AbsPlacement = Placement<Type, PointerMode::Absolute>;
    template<typename Type> using RelPlacement = Placement<Type, PointerMode::Relative>;
}
