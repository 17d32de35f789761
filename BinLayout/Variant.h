// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "ReadTraits.h"
#include "Record.h"
#include <variant>
#include <vector>
#include <optional>
#include <typeinfo>
#include <stdexcept>

namespace BinLayout
{
    enum class VariantErrorMode
    {
        Default,                    ///< same as ReturnAllErrors
        ReturnAllErrors,            ///< raise EnumErrors, with a record for every candidate that was tried
        ReturnUnexpectedError       ///< raise NoVariantMatch, without per-candidate detail
    };

    namespace ContextKey
    {
            // error mode used when reading std::variant<>
        struct VariantErrors { using ValueType = VariantErrorMode; static ValueType Default() { return VariantErrorMode::Default; } };
    }

    namespace Internal
    {
        void TraceRejectedCandidate(StringSection<> name, uint64_t position, const ReadError& error, const Context& ctx);
        [[noreturn]] void ThrowVariantFailure(uint64_t position, VariantErrorMode mode, std::vector<VariantAttempt>&& attempts);
    }

    /// <summary>Chooses between a fixed, ordered set of candidate layouts at one position</summary>
    /// Candidates are tried in the order they are given. The first one that reads without
    /// error is committed, and later candidates are ignored. After each failed candidate
    /// the stream is returned to the starting position.
    /// <code>
    ///     return VariantResolver<Shape>(stream, ctx)
    ///         .UnitCandidate("Empty", uint8_t(0), Shape{Shape::Empty{}})
    ///         .Candidate("Circle", [](IInputStream& s, const Context& c) { return Shape{ReadAndResolve<Circle>(s, c, {})}; })
    ///         .Finish();
    /// </code>
    /// Each candidate must do both phases of reading (Read and Resolve), because a pointer
    /// that can't be followed is a reason to reject a candidate.
    template<typename Type>
        class VariantResolver
    {
    public:
        /// <summary>Try a candidate; "fn" is called as fn(IInputStream&, const Context&)</summary>
        template<typename Fn>
            VariantResolver& Candidate(StringSection<> name, Fn&& fn);

        /// <summary>Try reading and resolving "Alternative", with default arguments</summary>
        template<typename Alternative>
            VariantResolver& CandidateType(StringSection<> name);

        /// <summary>Candidate with no fields; only a magic value that must match</summary>
        template<typename MagicType>
            VariantResolver& UnitCandidate(StringSection<> name, MagicType magic, Type value);

        Type Finish();

        bool HasMatch() const { return _result.has_value(); }
        const std::vector<VariantAttempt>& GetAttempts() const { return _attempts; }
        uint64_t GetStartPosition() const { return _startPosition; }

        VariantResolver(IInputStream& stream, const Context& ctx, VariantErrorMode mode = VariantErrorMode::Default);
        VariantResolver(const VariantResolver&) = delete;
        VariantResolver& operator=(const VariantResolver&) = delete;
    private:
        IInputStream* _stream;
        Context _context;
        VariantErrorMode _mode;
        uint64_t _startPosition;
        std::optional<Type> _result;
        std::vector<VariantAttempt> _attempts;

        void RecordFailure(StringSection<> name, std::shared_ptr<const ReadError> error);
    };

    template<typename Type>
        template<typename Fn>
            VariantResolver<Type>& VariantResolver<Type>::Candidate(StringSection<> name, Fn&& fn)
    {
        if (_result) return *this;

        TRY {
            _result.emplace(fn(*_stream, _context));
            return *this;
        } CATCH(const ReadError& e) {
            RecordFailure(name, e.Clone());
        } CATCH(const std::runtime_error& e) {
                // runtime failures from client code are reported as custom errors. Contract
                // violations (std::logic_error) and allocation failures are not reasons to
                // reject a candidate, so they propagate
            RecordFailure(name, std::make_shared<CustomError>(_startPosition, e.what()));
        } CATCH_END

        SeekTo(*_stream, _startPosition);
        return *this;
    }

    template<typename Type>
        template<typename Alternative>
            VariantResolver<Type>& VariantResolver<Type>::CandidateType(StringSection<> name)
    {
        static_assert(HasDefaultArgs<Alternative>, "Use Candidate() with a custom function for alternatives that require arguments");
        return Candidate(
            name,
            [](IInputStream& stream, const Context& ctx) {
                return Type{ReadAndResolve<Alternative>(stream, ctx, NoArgs{})};
            });
    }

    template<typename Type>
        template<typename MagicType>
            VariantResolver<Type>& VariantResolver<Type>::UnitCandidate(StringSection<> name, MagicType magic, Type value)
    {
        return Candidate(
            name,
            [magic, &value](IInputStream& stream, const Context& ctx) {
                RecordReader reader(stream, ctx);
                reader.Magic(magic);
                return std::move(value);
            });
    }

    template<typename Type>
        Type VariantResolver<Type>::Finish()
    {
        if (_result)
            return std::move(*_result);
        Internal::ThrowVariantFailure(_startPosition, _mode, std::move(_attempts));
    }

    template<typename Type>
        void VariantResolver<Type>::RecordFailure(StringSection<> name, std::shared_ptr<const ReadError> error)
    {
        Internal::TraceRejectedCandidate(name, _startPosition, *error, _context);
        _attempts.push_back(VariantAttempt{name.AsString(), std::move(error)});
    }

    template<typename Type>
        VariantResolver<Type>::VariantResolver(IInputStream& stream, const Context& ctx, VariantErrorMode mode)
    : _stream(&stream), _context(ctx), _mode(mode)
    {
        _startPosition = TellPosition(stream);
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    namespace Internal
    {
        template<typename Type, typename=void> struct HasCandidateName : std::false_type {};
        template<typename Type> struct HasCandidateName<Type, std::void_t<decltype(Type::CandidateName())>> : std::true_type {};

        template<typename Type>
            StringSection<> GetCandidateName()
        {
            if constexpr (HasCandidateName<Type>::value) {
                return Type::CandidateName();
            } else
                return typeid(Type).name();
        }
    }

    /// <summary>Reads one of the alternatives of a std::variant<></summary>
    /// Alternatives are tried in declaration order; see VariantResolver. Alternatives can
    /// provide a static CandidateName() to name themselves in EnumErrors. Otherwise the
    /// name is typeid(Alternative).name(), which is implementation defined (mangled on
    /// GCC and Clang). The error mode comes from ContextKey::VariantErrors.
    template<typename... Alternatives>
        struct ReadTraits<std::variant<Alternatives...>>
    {
        static_assert((HasDefaultArgs<Alternatives> && ...), "Every alternative of a variant must be readable without arguments");
        using Args = NoArgs;
        using Type = std::variant<Alternatives...>;

        static Type Read(IInputStream& stream, const Context& ctx, const Args&)
        {
            VariantResolver<Type> resolver(stream, ctx, ctx.Get<ContextKey::VariantErrors>());
            (resolver.template CandidateType<Alternatives>(Internal::GetCandidateName<Alternatives>()), ...);
            return resolver.Finish();
        }

            // candidates are resolved as they are tried, so there's nothing left to do here
        static void Resolve(Type&, IInputStream&, const Context&, const Args&) {}
    };
}
