// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Prefix.h"
#include <utility>
#include <iterator>
#include <type_traits>
#include <vector>

namespace Utility
{
    template<typename Type>
        inline Type* PtrAdd(Type* input, ptrdiff_t offset)  { return (Type*)(size_t(input) + offset); }

    inline ptrdiff_t PtrDiff(const void* lhs, const void* rhs) { return ptrdiff_t(size_t(lhs) - size_t(rhs)); }

    /// <summary>A pair of iterators describing a contiguous range</summary>
    /// Used to pass around buffers without committing to a container type.
    /// IteratorRange<void*> and IteratorRange<const void*> are "opaque" ranges, where
    /// size() is measured in bytes.
    template<typename Iterator>
        class IteratorRange : public std::pair<Iterator, Iterator>
    {
    public:
        Iterator begin() const  { return this->first; }
        Iterator end() const    { return this->second; }
        bool empty() const      { return this->first == this->second; }

        size_t size() const
        {
            if constexpr (std::is_same_v<std::decay_t<Iterator>, void*> || std::is_same_v<std::decay_t<Iterator>, const void*>) {
                return size_t(PtrDiff(this->second, this->first));
            } else
                return size_t(std::distance(this->first, this->second));
        }

        template<typename I=Iterator>
            auto operator[](size_t index) const -> decltype(std::declval<I>()[index]) { return this->first[index]; }

        template<typename OtherIterator>
            IteratorRange<OtherIterator> Cast() const { return IteratorRange<OtherIterator>((OtherIterator)this->first, (OtherIterator)this->second); }

            // (only valid for pointer iterators)
        operator IteratorRange<const void*>() const
        {
            return IteratorRange<const void*>((const void*)this->first, (const void*)this->second);
        }

        IteratorRange() : std::pair<Iterator, Iterator>(Iterator{}, Iterator{}) {}
        IteratorRange(Iterator b, Iterator e) : std::pair<Iterator, Iterator>(b, e) {}
    };

    template<typename Iterator>
        IteratorRange<Iterator> MakeIteratorRange(Iterator begin, Iterator end) { return IteratorRange<Iterator>(begin, end); }

    template<typename Type, size_t Count>
        IteratorRange<Type*> MakeIteratorRange(Type (&array)[Count]) { return IteratorRange<Type*>(array, &array[Count]); }

    template<typename Type, typename Allocator>
        IteratorRange<Type*> MakeIteratorRange(std::vector<Type, Allocator>& vector) { return IteratorRange<Type*>(vector.data(), vector.data() + vector.size()); }

    template<typename Type, typename Allocator>
        IteratorRange<const Type*> MakeIteratorRange(const std::vector<Type, Allocator>& vector) { return IteratorRange<const Type*>(vector.data(), vector.data() + vector.size()); }

    template<typename Type>
        IteratorRange<void*> MakeOpaqueIteratorRange(Type& object) { return IteratorRange<void*>(&object, PtrAdd(&object, sizeof(Type))); }

    template<typename Type>
        IteratorRange<const void*> MakeOpaqueIteratorRange(const Type& object) { return IteratorRange<const void*>(&object, PtrAdd(&object, sizeof(Type))); }
}

using namespace Utility;
