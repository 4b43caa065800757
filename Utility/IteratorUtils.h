// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "PtrUtils.h"       // for AsPointer
#include <vector>
#include <algorithm>
#include <iterator>
#include <initializer_list>
#include <type_traits>      // (for is_constructible)

namespace Utility
{
        //
        //  Small utilities for common STL operations. Keep this file light; it's
        //  included by most headers in the project.
        //

    template <typename Vector, typename Pred>
        typename Vector::iterator FindIf(Vector& v, Pred&& predicate)
        {
            return std::find_if(v.begin(), v.end(), std::forward<Pred>(predicate));
        }

    template <typename Vector, typename Pred>
        typename Vector::const_iterator FindIf(const Vector& v, Pred&& predicate)
        {
            return std::find_if(v.cbegin(), v.cend(), std::forward<Pred>(predicate));
        }

    template<typename SearchI, typename CompareI>
        SearchI FindLastOf(
            SearchI searchStart, SearchI searchEnd,
            CompareI compare)
        {
            if (searchStart == searchEnd) return searchEnd;
            auto i = searchEnd-1;
            for (;;) {
                if (*i == compare)
                    return i;
                if (i == searchStart) break;
                --i;
            }
            return searchEnd;
        }

	namespace Internal
	{
        template<
            typename DstType, typename SrcType,
            typename std::enable_if<
                std::is_constructible_v<DstType, SrcType>
            >::type* =nullptr
            > DstType ImplicitIteratorCast(SrcType input) { return input; }

        template<
            typename DstType, typename SrcType,
            typename std::enable_if<
                !std::is_constructible_v<DstType, SrcType>
                && std::is_constructible_v<DstType, decltype(AsPointer(std::declval<SrcType>()))>
            >::type* =nullptr
            > DstType ImplicitIteratorCast(SrcType input) { return AsPointer(input); }
	}

    /// <summary>A begin/end pair of iterators, usable in range-based for</summary>
    /// Pointer style ranges can be constructed from any container with contiguous
    /// storage (vector, array, initializer_list, etc).
    template<typename Iterator>
        class IteratorRange : public std::pair<Iterator, Iterator>
        {
        public:
            Iterator begin() const      { return this->first; }
            Iterator end() const        { return this->second; }
            Iterator cbegin() const     { return this->first; }
            Iterator cend() const       { return this->second; }
            bool empty() const          { return this->first == this->second; }
			size_t size() const			{ return (size_t)std::distance(this->first, this->second); }

            using iterator = Iterator;

            auto operator[](size_t index) const -> decltype(*std::declval<Iterator>()) { return this->first[index]; }

            IteratorRange() : std::pair<Iterator, Iterator>(Iterator{}, Iterator{}) {}

            template<typename OtherIteratorType, decltype(Internal::ImplicitIteratorCast<Iterator>(std::declval<OtherIteratorType>()))* = nullptr>
                IteratorRange(OtherIteratorType f, OtherIteratorType s) : std::pair<Iterator, Iterator>(Internal::ImplicitIteratorCast<Iterator>(f), Internal::ImplicitIteratorCast<Iterator>(s)) {}

            // Conversion from any collection with const begin() and end() methods (so long as
            // its iterators convert down to this range's iterator type). Be conscious of this
            // when passing temporaries; the range doesn't extend their lifetime
            template<   typename OtherRange,
                        decltype(Internal::ImplicitIteratorCast<Iterator>(std::begin(std::declval<const OtherRange&>())))* = nullptr>
                IteratorRange(const OtherRange& copyFrom)
                    : std::pair<Iterator, Iterator>(Internal::ImplicitIteratorCast<Iterator>(std::begin(copyFrom)), Internal::ImplicitIteratorCast<Iterator>(std::end(copyFrom))) {}
        };

    template<typename Iterator>
        IteratorRange<Iterator> MakeIteratorRange(Iterator begin, Iterator end)
        {
            return IteratorRange<Iterator>(begin, end);
        }

    template<typename ArrayElement, int Count>
        IteratorRange<ArrayElement*> MakeIteratorRange(ArrayElement (&c)[Count])
        {
            return IteratorRange<ArrayElement*>(&c[0], &c[Count]);
        }

    template<typename Type, typename Allocator>
        IteratorRange<const Type*> MakeIteratorRange(const std::vector<Type, Allocator>& v)
        {
            return IteratorRange<const Type*>(v.data(), v.data() + v.size());
        }

    template<typename Type, typename Allocator>
        IteratorRange<Type*> MakeIteratorRange(std::vector<Type, Allocator>& v)
        {
            return IteratorRange<Type*>(v.data(), v.data() + v.size());
        }
}

using namespace Utility;
