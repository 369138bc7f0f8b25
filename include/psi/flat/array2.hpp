////////////////////////////////////////////////////////////////////////////////
/// psi::flat fixed-size two-dimensional array
///
/// array2<T> stores num_rows * num_columns elements in a single contiguous,
/// row-major buffer. Dimensions are fixed at construction (no resizing).
/// Rows are handed out as std::spans over the buffer.
///
/// The buffer is a boost::container::vector rather than an std::vector so
/// that array2<bool> stores real bools (and can hand out spans of them).
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

#include "errors.hpp"

#include <boost/assert.hpp>
#include <boost/container/vector.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

template <typename T>
class array2
{
public:
    using value_type   = T;
    using size_type    = std::size_t;
    using storage_type = boost::container::vector<T>;
    using row_type       = std::span<T      >;
    using const_row_type = std::span<T const>;

    array2() = default; // 0 x 0

    // Throws std::length_error if num_columns * num_rows does not fit size_type.
    array2( size_type const num_columns, size_type const num_rows, T const & init_value )
        : data_( checked_num_elements( num_columns, num_rows ), init_value ), num_columns_{ num_columns } {}

    // Adopt a row-major buffer; its size must be a multiple of num_columns.
    array2( size_type const num_columns, storage_type elements )
        : data_{ std::move( elements ) }, num_columns_{ num_columns }
    {
        if ( !is_whole_rows( num_columns_, data_.size() ) )
            detail::throw_inconsistent_row_length();
    }

    array2( std::initializer_list<std::initializer_list<T>> const rows )
        : array2( from_rows( rows ) ) {}

    /// All rows must have the same length (otherwise throws
    /// inconsistent_row_length). No rows yields a 0 x 0 array.
    template <typename Rows>
    requires
        std::ranges::input_range<Rows const> &&
        std::ranges::input_range<std::ranges::range_reference_t<Rows const>> &&
        std::ranges::sized_range<std::ranges::range_reference_t<Rows const>>
    [[ nodiscard ]] static array2 from_rows( Rows const & rows )
    {
        array2 result;
        bool first{ true };
        for ( auto && row : rows )
        {
            auto const row_length{ static_cast<size_type>( std::ranges::size( row ) ) };
            if ( first )
            {
                result.num_columns_ = row_length;
                first = false;
            }
            else if ( row_length != result.num_columns_ )
            {
                detail::throw_inconsistent_row_length();
            }
            std::ranges::copy( row, std::back_inserter( result.data_ ) );
        }
        return result;
    }

    /// Can num_elements be laid out as whole rows of num_columns? (Zero
    /// columns only admit zero elements.)
    [[ nodiscard ]] static constexpr bool is_whole_rows( size_type const num_columns, size_type const num_elements ) noexcept
    {
        return num_columns ? num_elements % num_columns == 0 : num_elements == 0;
    }

    array2( array2 const & ) = default;
    array2( array2 && )      = default;

    array2 & operator=( array2 const & ) = default;
    array2 & operator=( array2 && )      = default;

    //--------------------------------------------------------------------------
    // Dimensions
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type num_columns () const noexcept { return num_columns_; }
    [[ nodiscard ]] size_type num_rows    () const noexcept { return num_columns_ ? data_.size() / num_columns_ : 0; }
    [[ nodiscard ]] size_type num_elements() const noexcept { return data_.size(); }

    //--------------------------------------------------------------------------
    // Element access (row-major)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] const_row_type elements() const noexcept { return { data_.data(), data_.size() }; }
    [[ nodiscard ]]       row_type elements()       noexcept { return { data_.data(), data_.size() }; }

    [[ nodiscard ]] std::optional<const_row_type> row( size_type const row_index ) const noexcept
    {
        if ( row_index >= num_rows() )
            return std::nullopt;
        return (*this)[ row_index ];
    }
    [[ nodiscard ]] std::optional<row_type> row( size_type const row_index ) noexcept
    {
        if ( row_index >= num_rows() )
            return std::nullopt;
        return (*this)[ row_index ];
    }

    [[ nodiscard ]] const_row_type operator[]( size_type const row_index ) const noexcept
    {
        BOOST_ASSERT( row_index < num_rows() );
        return { data_.data() + row_index * num_columns_, num_columns_ };
    }
    [[ nodiscard ]] row_type operator[]( size_type const row_index ) noexcept
    {
        BOOST_ASSERT( row_index < num_rows() );
        return { data_.data() + row_index * num_columns_, num_columns_ };
    }

    [[ nodiscard ]] const_row_type at( size_type const row_index ) const
    {
        if ( row_index >= num_rows() ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::flat::array2: row index out of bounds" );
        return (*this)[ row_index ];
    }
    [[ nodiscard ]] row_type at( size_type const row_index )
    {
        if ( row_index >= num_rows() ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::flat::array2: row index out of bounds" );
        return (*this)[ row_index ];
    }

    /// Random access view of the rows (one span per row)
    [[ nodiscard ]] auto rows() const noexcept
    {
        return std::views::iota( size_type{ 0 }, num_rows() )
             | std::views::transform( [this]( size_type const row_index ) { return (*this)[ row_index ]; } );
    }
    [[ nodiscard ]] auto rows() noexcept
    {
        return std::views::iota( size_type{ 0 }, num_rows() )
             | std::views::transform( [this]( size_type const row_index ) { return (*this)[ row_index ]; } );
    }

    friend bool operator==( array2 const & a, array2 const & b ) noexcept
    {
        return a.num_columns_ == b.num_columns_ && a.data_ == b.data_;
    }

private:
    static size_type checked_num_elements( size_type const num_columns, size_type const num_rows )
    {
        if ( num_rows && num_columns > std::numeric_limits<size_type>::max() / num_rows ) [[ unlikely ]]
            detail::throw_length_error( "psi::flat::array2: dimensions overflow" );
        return num_columns * num_rows;
    }

    storage_type data_;
    size_type    num_columns_{ 0 };
}; // class array2

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
