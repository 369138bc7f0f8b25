////////////////////////////////////////////////////////////////////////////////
/// Boost.Serialization support for psi::flat containers (non-intrusive).
///
/// Both containers are serialized as plain data: no class id / version
/// framing of their own and no object tracking.
///
///   ordered_vector: exactly like its underlying Storage (an ordinary element
///                    sequence, nothing records the sortedness). Loading goes
///                    through from_unsorted: the input is resorted by the
///                    loading container's key and duplicate keys throw
///                    duplicate_key, so untrusted archives cannot break the
///                    invariants.
///   array2        : column count, element count, row-major elements.
///                    An element count that is not a multiple of the column
///                    count throws inconsistent_row_length.
///
/// Storage types other than std::vector need their own Boost.Serialization
/// support included by the user.
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

#include "array2.hpp"
#include "ordered_vector.hpp"

#include <boost/mpl/int.hpp>
#include <boost/mpl/integral_c_tag.hpp>
#include <boost/serialization/array_wrapper.hpp>
#include <boost/serialization/level.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/tracking.hpp>
#include <boost/serialization/vector.hpp>

#include <cstddef>
#include <utility>
//------------------------------------------------------------------------------
namespace boost::serialization
{
//------------------------------------------------------------------------------

//==============================================================================
// Traits: plain data, untracked
//==============================================================================

template <typename T, typename KeyOf, typename Compare, typename Storage>
struct implementation_level<psi::flat::ordered_vector<T, KeyOf, Compare, Storage>>
{
    using tag  = mpl::integral_c_tag;
    using type = mpl::int_<object_serializable>;
    BOOST_STATIC_CONSTANT( int, value = type::value );
};

template <typename T, typename KeyOf, typename Compare, typename Storage>
struct tracking_level<psi::flat::ordered_vector<T, KeyOf, Compare, Storage>>
{
    using tag  = mpl::integral_c_tag;
    using type = mpl::int_<track_never>;
    BOOST_STATIC_CONSTANT( int, value = type::value );
};

template <typename T>
struct implementation_level<psi::flat::array2<T>>
{
    using tag  = mpl::integral_c_tag;
    using type = mpl::int_<object_serializable>;
    BOOST_STATIC_CONSTANT( int, value = type::value );
};

template <typename T>
struct tracking_level<psi::flat::array2<T>>
{
    using tag  = mpl::integral_c_tag;
    using type = mpl::int_<track_never>;
    BOOST_STATIC_CONSTANT( int, value = type::value );
};


//==============================================================================
// ordered_vector
//==============================================================================

template <class Archive, typename T, typename KeyOf, typename Compare, typename Storage>
void save( Archive & ar, psi::flat::ordered_vector<T, KeyOf, Compare, Storage> const & ov, unsigned int /*version*/ )
{
    ar << make_nvp( "items", ov.items() );
}

template <class Archive, typename T, typename KeyOf, typename Compare, typename Storage>
void load( Archive & ar, psi::flat::ordered_vector<T, KeyOf, Compare, Storage> & ov, unsigned int /*version*/ )
{
    using container = psi::flat::ordered_vector<T, KeyOf, Compare, Storage>;
    Storage items;
    ar >> make_nvp( "items", items );
    ov = container::from_unsorted( std::move( items ), ov.key_comp() );
}

template <class Archive, typename T, typename KeyOf, typename Compare, typename Storage>
void serialize( Archive & ar, psi::flat::ordered_vector<T, KeyOf, Compare, Storage> & ov, unsigned int const version )
{
    split_free( ar, ov, version );
}


//==============================================================================
// array2
//==============================================================================

template <class Archive, typename T>
void save( Archive & ar, psi::flat::array2<T> const & a, unsigned int /*version*/ )
{
    std::size_t const num_columns { a.num_columns () };
    std::size_t const num_elements{ a.num_elements() };
    ar << make_nvp( "columns" , num_columns  );
    ar << make_nvp( "count"   , num_elements );
    ar << make_nvp( "elements", make_array( a.elements().data(), num_elements ) );
}

template <class Archive, typename T>
void load( Archive & ar, psi::flat::array2<T> & a, unsigned int /*version*/ )
{
    std::size_t num_columns { 0 };
    std::size_t num_elements{ 0 };
    ar >> make_nvp( "columns", num_columns  );
    ar >> make_nvp( "count"  , num_elements );
    // reject a malformed shape before allocating for it
    if ( !psi::flat::array2<T>::is_whole_rows( num_columns, num_elements ) )
        psi::flat::detail::throw_inconsistent_row_length();
    typename psi::flat::array2<T>::storage_type elements( num_elements );
    ar >> make_nvp( "elements", make_array( elements.data(), num_elements ) );
    a = psi::flat::array2<T>( num_columns, std::move( elements ) );
}

template <class Archive, typename T>
void serialize( Archive & ar, psi::flat::array2<T> & a, unsigned int const version )
{
    split_free( ar, a, version );
}

//------------------------------------------------------------------------------
} // namespace boost::serialization
//------------------------------------------------------------------------------
