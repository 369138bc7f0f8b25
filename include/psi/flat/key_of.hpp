////////////////////////////////////////////////////////////////////////////////
/// Key extractors for psi::flat::ordered_vector.
///
/// A key extractor (KeyOf) is a stateless function object type mapping an
/// element to the key it is ordered and looked up by. The extractor is a
/// template parameter of the container so two ordered_vectors over the same
/// element type but with different extractors are distinct types.
///
/// Extractors must be pure: the same element must always yield the same key.
/// This is not (and cannot be) checked - a non-deterministic extractor makes
/// the container's behaviour undefined.
///
/// Provided:
///   - key_first         : std::get<0> (the "( key, data ) pair" convention)
///   - key_identity      : the element itself
///   - key_member<&T::m> : a data member
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

#include <concepts>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

template <typename KeyOf, typename T>
using key_type_t = std::remove_cvref_t<std::invoke_result_t<KeyOf const &, T const &>>;

/// Empty + default constructible: the extractor carries no state and is
/// materialized on demand (KeyOf{}( item )) rather than stored.
template <typename KeyOf, typename T>
concept KeyExtractor =
    std::is_empty_v<KeyOf>            &&
    std::default_initializable<KeyOf> &&
    std::regular_invocable<KeyOf const &, T const &>;


struct key_first
{
    template <typename Tuple>
    [[ gnu::pure ]] constexpr decltype( auto ) operator()( Tuple const & item ) const noexcept
    {
        using std::get;
        return get<0>( item );
    }
}; // struct key_first

using key_identity = std::identity;

template <auto member>
struct key_member;

template <typename Class, typename Member, Member Class::* member>
struct key_member<member>
{
    [[ gnu::pure ]] constexpr Member const & operator()( Class const & item ) const noexcept { return item.*member; }
}; // struct key_member

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
