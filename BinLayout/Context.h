// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Endian.h"
#include "../Core/Exceptions.h"
#include <memory>
#include <optional>
#include <string>
#include <any>
#include <typeindex>
#include <type_traits>
#include <stdexcept>

namespace BinLayout
{
    namespace DiagnosticFlags
    {
        enum Enum
        {
            TraceReads = 1<<0,          ///< log every primitive decode to Log(Verbose)
            TraceVariants = 1<<1        ///< log every rejected variant candidate to Log(Verbose)
        };
        using BitField = unsigned;
    }

    //
    //  Keys for Context. A key is a tag type with a "ValueType" member, and
    //  optionally a static Default() that is used when the key has not been set.
    //  Clients can add their own keys in the same form; these are stored in the
    //  extension slots of the Context.
    //
    namespace ContextKey
    {
        struct ByteOrder        { using ValueType = Endian; static ValueType Default() { return Endian::Native; } };
        struct BaseOffset       { using ValueType = uint64_t; static ValueType Default() { return 0; } };
        struct DeclaredCount    { using ValueType = std::optional<size_t>; static ValueType Default() { return {}; } };
        struct Diagnostics      { using ValueType = DiagnosticFlags::BitField; static ValueType Default() { return 0; } };
        struct VariableName     { using ValueType = std::string; static ValueType Default() { return {}; } };
    }

    namespace Internal
    {
        template<typename Key, typename = void> struct KeyHasDefault : std::false_type {};
        template<typename Key> struct KeyHasDefault<Key, std::void_t<decltype(Key::Default())>> : std::true_type {};

        template<typename Key> constexpr bool IsBuiltInKey =
                std::is_same_v<Key, ContextKey::ByteOrder>
            ||  std::is_same_v<Key, ContextKey::BaseOffset>
            ||  std::is_same_v<Key, ContextKey::DeclaredCount>
            ||  std::is_same_v<Key, ContextKey::Diagnostics>;
    }

    /// <summary>Configuration threaded through every read</summary>
    /// Context is an immutable value. Use With<Key>() (or one of the WithXXX() shortcuts)
    /// to create a new Context that differs by one value; the original is never changed.
    /// Copies are cheap: the built in settings are held by value, and extension values
    /// are in a linked list shared between a Context and any overlays derived from it.
    ///
    /// Records pass their own Context to each field, plus any overrides introduced by
    /// earlier fields. So a setting only flows forward and downwards; never back up to
    /// the parent.
    class Context
    {
    public:
        template<typename Key>
            typename Key::ValueType Get() const;

        template<typename Key>
            const typename Key::ValueType* TryGet() const;

        template<typename Key>
            Context With(typename Key::ValueType value) const;

        template<typename Key>
            bool Contains() const;

        Endian GetByteOrder() const { return _byteOrder; }
        uint64_t GetBaseOffset() const { return _baseOffset; }
        std::optional<size_t> GetDeclaredCount() const { return _declaredCount; }
        DiagnosticFlags::BitField GetDiagnostics() const { return _diagnostics; }
        bool IsTracing() const { return !!(_diagnostics & DiagnosticFlags::TraceReads); }

        Context WithByteOrder(Endian byteOrder) const { return With<ContextKey::ByteOrder>(byteOrder); }
        Context WithBaseOffset(uint64_t baseOffset) const { return With<ContextKey::BaseOffset>(baseOffset); }
        Context WithNestedBaseOffset(uint64_t offset) const { return With<ContextKey::BaseOffset>(_baseOffset + offset); }
        Context WithDeclaredCount(std::optional<size_t> count) const { return With<ContextKey::DeclaredCount>(count); }
        Context WithDiagnostics(DiagnosticFlags::BitField flags) const { return With<ContextKey::Diagnostics>(flags); }

        Context(Endian byteOrder = Endian::Native);
        ~Context();
        Context(const Context&);
        Context& operator=(const Context&);
        Context(Context&&) noexcept;
        Context& operator=(Context&&) noexcept;
    private:
        Endian _byteOrder;
        uint64_t _baseOffset = 0;
        std::optional<size_t> _declaredCount;
        DiagnosticFlags::BitField _diagnostics = 0;
        unsigned _explicitBuiltIns = 0;

        struct ExtensionNode;
        std::shared_ptr<const ExtensionNode> _extensions;

        const std::any* FindExtension(std::type_index key) const;
        Context WithExtension(std::type_index key, std::any&& value) const;
        [[noreturn]] static void ThrowMissingKey(std::type_index key);

        template<typename Key> static constexpr unsigned BuiltInBit();
    };

    template<typename Key>
        constexpr unsigned Context::BuiltInBit()
    {
        if constexpr (std::is_same_v<Key, ContextKey::ByteOrder>) return 1u<<0u;
        else if constexpr (std::is_same_v<Key, ContextKey::BaseOffset>) return 1u<<1u;
        else if constexpr (std::is_same_v<Key, ContextKey::DeclaredCount>) return 1u<<2u;
        else return 1u<<3u;
    }

    template<typename Key>
        const typename Key::ValueType* Context::TryGet() const
    {
        if constexpr (std::is_same_v<Key, ContextKey::ByteOrder>) return &_byteOrder;
        else if constexpr (std::is_same_v<Key, ContextKey::BaseOffset>) return (_explicitBuiltIns & BuiltInBit<Key>()) ? &_baseOffset : nullptr;
        else if constexpr (std::is_same_v<Key, ContextKey::DeclaredCount>) return (_explicitBuiltIns & BuiltInBit<Key>()) ? &_declaredCount : nullptr;
        else if constexpr (std::is_same_v<Key, ContextKey::Diagnostics>) return (_explicitBuiltIns & BuiltInBit<Key>()) ? &_diagnostics : nullptr;
        else {
            auto* ext = FindExtension(typeid(Key));
            return ext ? std::any_cast<typename Key::ValueType>(ext) : nullptr;
        }
    }

    template<typename Key>
        typename Key::ValueType Context::Get() const
    {
        if constexpr (std::is_same_v<Key, ContextKey::ByteOrder>) return _byteOrder;
        else if constexpr (std::is_same_v<Key, ContextKey::BaseOffset>) return _baseOffset;
        else if constexpr (std::is_same_v<Key, ContextKey::DeclaredCount>) return _declaredCount;
        else if constexpr (std::is_same_v<Key, ContextKey::Diagnostics>) return _diagnostics;
        else {
            if (auto* value = TryGet<Key>())
                return *value;
            if constexpr (Internal::KeyHasDefault<Key>::value) {
                return Key::Default();
            } else
                ThrowMissingKey(typeid(Key));
        }
    }

    template<typename Key>
        Context Context::With(typename Key::ValueType value) const
    {
        if constexpr (Internal::IsBuiltInKey<Key>) {
            Context result = *this;
            if constexpr (std::is_same_v<Key, ContextKey::ByteOrder>) result._byteOrder = value;
            else if constexpr (std::is_same_v<Key, ContextKey::BaseOffset>) result._baseOffset = value;
            else if constexpr (std::is_same_v<Key, ContextKey::DeclaredCount>) result._declaredCount = value;
            else result._diagnostics = value;
            result._explicitBuiltIns |= BuiltInBit<Key>();
            return result;
        } else
            return WithExtension(typeid(Key), std::any(std::move(value)));
    }

    template<typename Key>
        bool Context::Contains() const
    {
        return TryGet<Key>() != nullptr;
    }
}
