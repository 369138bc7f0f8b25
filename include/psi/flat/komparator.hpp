////////////////////////////////////////////////////////////////////////////////
/// Comparator traits, utilities and the Komparator wrapper for psi::flat
/// key-ordered containers.
///
/// Contents:
///   - is_simple_comparator<T>      : trait: can == replace double-negation test?
///   - comp_eq(comp, a, b)          : optimised equality from strict-weak comparator
///   - Komparator<KeyOf, Comparator>: EBO wrapper comparing keys, with le/eq
///                                     and an element sort by extracted key
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <boost/sort/pdqsort/pdqsort.hpp>

#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

//==============================================================================
// Comparator traits
//==============================================================================

/// Is this a "simple" comparator where operator== can be used instead of
/// the two-comparison equivalence test?  User specializations are intended.
template <typename T> constexpr bool is_simple_comparator{ false };
template <typename T> constexpr bool is_simple_comparator<std::less   <T>>{ std::is_fundamental_v<T> };
template <typename T> constexpr bool is_simple_comparator<std::greater<T>>{ std::is_fundamental_v<T> };
// Transparent comparators (std::less<>/std::greater<>) just delegate to the
// underlying < and > operators: they don't redefine ordering semantics, so
// == is safe for any ==-comparable type pair.
template <> inline constexpr bool is_simple_comparator<std::less   <void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::greater<void>>{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::less   >{ true };
template <> inline constexpr bool is_simple_comparator<std::ranges::greater>{ true };


//==============================================================================
// comp_eq: optimised equality from a strict-weak comparator (free function)
//==============================================================================

/// Three-tier dispatch:
///   1. Custom comp.eq() if available
///   2. Direct == for simple comparators
///   3. Standard two-comparison equivalence (!comp(a,b) && !comp(b,a))
template <typename Comp>
[[ gnu::pure ]] constexpr bool comp_eq( Comp const & comp, auto const & left, auto const & right )
{
    if constexpr ( requires{ comp.eq( left, right ); } )
        return comp.eq( left, right );
    else if constexpr ( is_simple_comparator<Comp> && requires{ left == right; } )
        return left == right;
    else
        return !comp( left, right ) && !comp( right, left );
}


//==============================================================================
// Komparator: key comparator wrapper (EBO via public inheritance)
//==============================================================================

/// Publicly inherits from Comparator for empty-base optimisation and, being
/// an aggregate, needs no forwarding constructors: Komparator<K, C>{ c } or
/// Komparator<K, C>{}.
///
/// KeyOf is never stored: it is required to be an empty type and is
/// materialized for each extraction.
///
/// sort() orders *elements* by their extracted keys:
///   1. Comparator's own sort( first, last, KeyOf ) if provided (e.g. radix sort)
///   2. pdqsort_branchless if Comparator::is_branchless
///   3. pdqsort (default fallback)
template <typename KeyOf, typename Comparator>
struct Komparator : Comparator
{
    /// True if Comparator supports heterogeneous lookup (has is_transparent tag)
    static constexpr bool transparent_comparator{ requires{ typename Comparator::is_transparent; } };

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    [[ gnu::pure ]] static constexpr decltype( auto ) key( auto const & item ) noexcept( noexcept( KeyOf{}( item ) ) ) { return KeyOf{}( item ); }

    [[ gnu::pure ]] constexpr bool le( auto const & left, auto const & right ) const noexcept( noexcept( std::declval<Comparator const &>()( left, right ) ) ) { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool eq( auto const & left, auto const & right ) const { return comp_eq( comp(), left, right ); }

    template <std::random_access_iterator It>
    constexpr void sort( It const first, It const last ) const
    {
        if constexpr ( requires{ comp().sort( first, last, KeyOf{} ); } )
        {
            comp().sort( first, last, KeyOf{} );
        }
        else
        {
            auto const by_key{ [this]( auto const & left, auto const & right ) { return le( key( left ), key( right ) ); } };
            if constexpr ( requires{ Comparator::is_branchless; requires( Comparator::is_branchless ); } )
                boost::sort::pdqsort_branchless( first, last, by_key );
            else
                boost::sort::pdqsort( first, last, by_key );
        }
    }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
