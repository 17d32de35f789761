// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "ReadTraits.h"
#include "../Utility/StringUtils.h"
#include <optional>
#include <string>
#include <stdexcept>

namespace BinLayout
{
    /// <summary>Per-field overrides of the record's Context</summary>
    /// These apply to one field only; use RecordReader::Override() for settings
    /// that should carry through to subsequent fields.
    class FieldOptions
    {
    public:
        std::optional<Endian> _byteOrder;
        std::optional<uint64_t> _baseOffset;        ///< base for relative pointers read by this field
        std::optional<size_t> _count;               ///< declared element count for sequence fields

        FieldOptions() = default;
        FieldOptions(Endian byteOrder) : _byteOrder(byteOrder) {}
    };

    /// <summary>Reads the fields of a record in declaration order</summary>
    /// This is what a record's static Read() is built on:
    /// <code>
    ///     static Header Read(IInputStream& stream, const Context& ctx, const NoArgs&)
    ///     {
    ///         RecordReader reader(stream, ctx, "Header");
    ///         reader.MagicBytes("HDR");
    ///         auto length = reader.Field<uint32_t>("length");            // transient
    ///         Header result;
    ///         result._data = reader.Field<std::vector<char>>("data", CountedArgs<>{length});
    ///         reader.Assert(result._data.size() < 1024, "header too large");
    ///         return result;
    ///     }
    /// </code>
    /// Overrides set with Override() or SetContext() affect only the fields read after
    /// them; they never affect the Context the caller passed in.
    class RecordReader
    {
    public:
        template<typename Type>
            Type Field(StringSection<> name);

        template<typename Type>
            Type Field(StringSection<> name, const ReadArgsOf<Type>& args);

        template<typename Type>
            Type Field(StringSection<> name, const FieldOptions& options);

        template<typename Type>
            Type Field(StringSection<> name, const ReadArgsOf<Type>& args, const FieldOptions& options);

        /// <summary>Read a field, then return to the position before it</summary>
        template<typename Type>
            Type Peek(StringSection<> name, const FieldOptions& options = {});

        /// <summary>Read a field through a custom parsing function</summary>
        /// "fn" is called as fn(IInputStream&, const Context&). std::runtime_errors that
        /// aren't ReadErrors are reported as CustomError at the position of the field.
        /// Anything else (std::logic_error, std::bad_alloc, ...) propagates untouched.
        template<typename Fn>
            auto ParseWith(StringSection<> name, Fn&& fn, const FieldOptions& options = {})
                -> decltype(fn(std::declval<IInputStream&>(), std::declval<const Context&>()));

        /// <summary>Read a value and require it to equal "expected"</summary>
        /// Raises BadMagic (at the position of the magic) on mismatch.
        template<typename Type>
            void Magic(Type expected, const FieldOptions& options = {});

        void MagicBytes(IteratorRange<const void*> expected);
        void MagicBytes(const char expected[]);

        void Assert(bool condition, StringSection<> message) const;
        [[noreturn]] void Fail(StringSection<> message) const;

        void AlignTo(uint64_t alignment);
        void Skip(int64_t byteCount);
        void SeekTo(uint64_t position);
        uint64_t GetPosition() const;

        template<typename Key>
            void Override(typename Key::ValueType value) { _context = _context.With<Key>(std::move(value)); }
        void SetContext(const Context& ctx) { _context = ctx; }
        const Context& GetContext() const { return _context; }
        IInputStream& GetStream() const { return *_stream; }
        uint64_t GetStartPosition() const { return _startPosition; }

        RecordReader(IInputStream& stream, const Context& ctx, const char recordName[] = nullptr);
        ~RecordReader();
        RecordReader(const RecordReader&) = delete;
        RecordReader& operator=(const RecordReader&) = delete;
    private:
        IInputStream* _stream;
        Context _context;
        uint64_t _startPosition;
        const char* _recordName;

        Context MakeFieldContext(StringSection<> name, const FieldOptions& options) const;
    };

    template<typename Type>
        Type RecordReader::Field(StringSection<> name)
    {
        return Field<Type>(name, FieldOptions{});
    }

    template<typename Type>
        Type RecordReader::Field(StringSection<> name, const ReadArgsOf<Type>& args)
    {
        return BinLayout::Read<Type>(*_stream, MakeFieldContext(name, {}), args);
    }

    template<typename Type>
        Type RecordReader::Field(StringSection<> name, const FieldOptions& options)
    {
        static_assert(HasDefaultArgs<Type>, "This field type requires arguments. Pass them to RecordReader::Field()");
        return BinLayout::Read<Type>(*_stream, MakeFieldContext(name, options), NoArgs{});
    }

    template<typename Type>
        Type RecordReader::Field(StringSection<> name, const ReadArgsOf<Type>& args, const FieldOptions& options)
    {
        return BinLayout::Read<Type>(*_stream, MakeFieldContext(name, options), args);
    }

    template<typename Type>
        Type RecordReader::Peek(StringSection<> name, const FieldOptions& options)
    {
        auto position = GetPosition();
        auto result = Field<Type>(name, options);
        BinLayout::SeekTo(*_stream, position);
        return result;
    }

    template<typename Fn>
        auto RecordReader::ParseWith(StringSection<> name, Fn&& fn, const FieldOptions& options)
            -> decltype(fn(std::declval<IInputStream&>(), std::declval<const Context&>()))
    {
        auto position = GetPosition();
        auto ctx = MakeFieldContext(name, options);
        TRY {
            return fn(*_stream, ctx);
        } CATCH(const ReadError&) {
            RETHROW;
        } CATCH(const std::runtime_error& e) {
            Throw(CustomError(position, e.what()));
        } CATCH_END
    }

    template<typename Type>
        void RecordReader::Magic(Type expected, const FieldOptions& options)
    {
        static_assert(Internal::IsPrimitive<Type>, "Magic values must be primitives. Use MagicBytes() for byte strings");
        auto position = GetPosition();
        auto found = BinLayout::Read<Type>(*_stream, MakeFieldContext("magic", options), NoArgs{});
        if (found != expected)
            Throw(BadMagic(position, ImpliedTyping::VariantRetained{Internal::DescribePrimitive<Type>(), MakeOpaqueIteratorRange(found)}));
    }
}
