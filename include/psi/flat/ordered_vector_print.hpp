////////////////////////////////////////////////////////////////////////////////
/// Debugging helper: dumps the key sequence of an ordered_vector.
/// Requires streamable keys; include only where needed.
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
#pragma once

#include "ordered_vector.hpp"

#include <ostream>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

template <typename T, typename KeyOf, typename Compare, typename Storage>
void print( std::ostream & os, ordered_vector<T, KeyOf, Compare, Storage> const & ov )
{
    os << '[';
    for ( typename Storage::size_type i{ 0 }; i < ov.size(); ++i )
    {
        if ( i )
            os << ", ";
        os << KeyOf{}( ov[ i ] );
    }
    os << "] (" << ov.size() << " items)\n";
}

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
