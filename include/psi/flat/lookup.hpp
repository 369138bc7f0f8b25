////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for psi::flat sorted containers.
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
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

/// LookupType: constrains which key types a sorted container's lookup
/// functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the comparator is transparent (has is_transparent tag), allowing
///       heterogeneous lookup with any type comparable with the stored key
///       (e.g. a string literal or std::string_view against std::string), or
///   (b) K is implicitly convertible to the key type (this subsumes the
///       K == key_type case via identity conversion).
///
/// Replaces the two-overload pattern
///   iterator find( key_type const & );                                  // always
///   template<class K> iterator find( K const & ) requires transparent;  // conditional
/// with a single constrained template:
///   template <LookupType<transparent, key_type> K = key_type>
///   iterator find( K const & );
template <typename K, bool transparent_comparator, typename StoredKeyType>
concept LookupType =
    transparent_comparator ||
    std::convertible_to<K const &, StoredKeyType const &>;


/// key_const_arg_t: what a LookupType key is bound to at the public API
/// boundary before it is handed to the search internals.
///   - transparent comparator      -> K const & (compared as is)
///   - non-transparent comparator  -> StoredKeyType const &, i.e. the
///     conversion happens exactly once per lookup instead of once per
///     comparison of the binary search.
template <typename K, bool transparent_comparator, typename StoredKeyType>
using key_const_arg_t = std::conditional_t
<
    transparent_comparator,
    K             const &,
    StoredKeyType const &
>;

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
