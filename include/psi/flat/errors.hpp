////////////////////////////////////////////////////////////////////////////////
/// Exceptions reported by psi::flat containers.
///
/// Both are logic errors: they signal misuse by the caller (a broken
/// invariant), never an ordinary runtime condition. Absent keys and out of
/// range rows are reported through std::optional / null pointers instead.
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

/// Two elements of an ordered_vector would share a key.
class duplicate_key : public std::logic_error
{
public:
    using std::logic_error::logic_error;
}; // class duplicate_key

/// array2 rows of unequal length (or a flat element count not divisible by
/// the column count).
class inconsistent_row_length : public std::logic_error
{
public:
    using std::logic_error::logic_error;
}; // class inconsistent_row_length

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_duplicate_key();
    [[ noreturn, gnu::cold ]] void throw_inconsistent_row_length();
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_length_error( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
