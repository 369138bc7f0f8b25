////////////////////////////////////////////////////////////////////////////////
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
#include <psi/flat/errors.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_duplicate_key          () { throw duplicate_key          ( "psi::flat::ordered_vector: duplicate keys are not allowed" ); }
    [[ noreturn, gnu::cold ]] void throw_inconsistent_row_length() { throw inconsistent_row_length( "psi::flat::array2: rows must have identical lengths" ); }
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const msg ) { throw std::out_of_range( msg ); }
    [[ noreturn, gnu::cold ]] void throw_length_error( char const * const msg ) { throw std::length_error( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
