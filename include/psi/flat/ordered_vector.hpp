////////////////////////////////////////////////////////////////////////////////
/// psi::flat key-ordered vector
///
/// ordered_vector<T, KeyOf, Compare, Storage> keeps its elements in a single
/// contiguous Storage, permanently sorted (strictly ascending, no duplicates)
/// by the key KeyOf{}( element ) under Compare.
///
/// The key lives inside T and is extracted with KeyOf; if the key is not
/// stored alongside the data use std::pair<Key, Data> with key_first.
/// Several extractors may exist for the same T, yielding differently ordered
/// (and mutually incompatible) container types.
///
/// Restrictions:
///   - Elements with equivalent keys are not allowed: construction from
///     unsorted data, insert/emplace and retain_map throw duplicate_key.
///   - Resident elements must not be modified in a way that changes their key
///     (get_mutable_by_key hands out a mutable reference under that
///     obligation). retain_map is the only sanctioned way to re-key elements.
///
/// Extensions beyond the usual flat_set interface:
///   - retain_map( f )           : single pass replace/re-key/drop + resort
///   - remove_by_key( k )        : erase returning the removed element
///   - get_by_key / get_mutable_by_key / index_of_key
///   - reserve(n), shrink_to_fit(), capacity(), extract(), items()
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
#include "key_of.hpp"
#include "komparator.hpp"
#include "lookup.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::flat
{
//------------------------------------------------------------------------------

//==============================================================================
// Sorted-input hint tag
//==============================================================================
struct sorted_unique_t { explicit sorted_unique_t() = default; };

inline constexpr sorted_unique_t sorted_unique{};


template <typename F, typename T>
concept retain_map_function =
    std::invocable<F &, T &&> &&
    std::convertible_to<std::invoke_result_t<F &, T &&>, std::optional<T>>;


template
<
    typename T,
    typename KeyOf,
    typename Compare = std::less<>,
    typename Storage = std::vector<T>
>
requires KeyExtractor<KeyOf, T>
class ordered_vector
    : protected Komparator<KeyOf, Compare>
{
    using Komp = Komparator<KeyOf, Compare>;

    static_assert( std::is_same_v<T, typename Storage::value_type>, "Storage::value_type must be T" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using value_type      = T;
    using key_of          = KeyOf;
    using key_type        = key_type_t<KeyOf, T>;
    using key_compare     = Compare;
    using storage_type    = Storage;
    using size_type       = typename Storage::size_type;
    using difference_type = std::ptrdiff_t;
    using reference       = T const &;
    using const_reference = T const &;

    // Elements are only ever exposed as const through iterators: mutating a
    // key in place would silently break the ordering.
    using iterator               = typename Storage::const_iterator;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;

    using Komp::transparent_comparator;

    static auto constexpr nothrow_move_constructible
    {
        std::is_nothrow_move_constructible_v<Storage> &&
        std::is_nothrow_copy_constructible_v<Compare>
    };

private:
    // a non-transparent comparator gets the key converted to key_type once,
    // at the public entry point
    template <typename K>
    using lookup_arg = key_const_arg_t<K, Komp::transparent_comparator, key_type>;

    template <typename K>
    static bool constexpr nothrow_lookup
    {
        std::is_nothrow_constructible_v<lookup_arg<K>, K const &>                                                                 &&
        noexcept( Komp::key( std::declval<T const &>() ) )                                                                        &&
        noexcept( std::declval<Komp const &>().le( Komp::key( std::declval<T const &>() ), std::declval<lookup_arg<K>>() ) )    &&
        noexcept( std::declval<Komp const &>().le( std::declval<lookup_arg<K>>(), Komp::key( std::declval<T const &>() ) ) )
    };

public:
    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    constexpr ordered_vector() = default;

    constexpr explicit ordered_vector( Compare const & comp ) noexcept( std::is_nothrow_copy_constructible_v<Compare> )
        : Komp{ comp } {}

    // Unsorted storage: sort, then reject duplicates
    constexpr explicit ordered_vector( Storage items, Compare const & comp = Compare{} )
        : Komp{ comp }, storage_{ std::move( items ) }
    {
        sort_and_validate();
    }

    // Adopt a caller-sorted, duplicate-free sequence as is (checked in debug
    // builds only)
    constexpr ordered_vector( sorted_unique_t, Storage items, Compare const & comp = Compare{} ) noexcept( nothrow_move_constructible )
        : Komp{ comp }, storage_{ std::move( items ) }
    {
        BOOST_ASSERT_MSG( is_sorted_unique(), "Input not sorted by key or has duplicate keys" );
    }

    template <std::input_iterator InputIt>
    constexpr ordered_vector( InputIt const first, InputIt const last, Compare const & comp = Compare{} )
        : Komp{ comp }, storage_( first, last )
    {
        sort_and_validate();
    }

    constexpr ordered_vector( std::initializer_list<value_type> const il, Compare const & comp = Compare{} )
        : ordered_vector( il.begin(), il.end(), comp ) {}

    [[ nodiscard ]] static constexpr ordered_vector from_unsorted( Storage items, Compare const & comp = Compare{} )
    {
        return ordered_vector( std::move( items ), comp );
    }

    constexpr ordered_vector( ordered_vector const & ) = default;
    constexpr ordered_vector( ordered_vector && )      = default;

    constexpr ordered_vector & operator=( ordered_vector const & ) = default;
    constexpr ordered_vector & operator=( ordered_vector && )      = default;

    constexpr ordered_vector & operator=( std::initializer_list<value_type> const il )
    {
        *this = ordered_vector( il, key_comp() );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    constexpr iterator begin() const noexcept { return storage_.cbegin(); }
    constexpr iterator end  () const noexcept { return storage_.cend  (); }

    constexpr iterator cbegin() const noexcept { return begin(); }
    constexpr iterator cend  () const noexcept { return end  (); }

    constexpr reverse_iterator rbegin() const noexcept { return reverse_iterator{ end  () }; }
    constexpr reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

    constexpr reverse_iterator crbegin() const noexcept { return rbegin(); }
    constexpr reverse_iterator crend  () const noexcept { return rend  (); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool      empty   () const noexcept { return storage_.empty(); }
    [[ nodiscard ]] constexpr size_type size    () const noexcept { return static_cast<size_type>( storage_.size() ); }
    [[ nodiscard ]] constexpr size_type max_size() const noexcept { return storage_.max_size(); }

    [[ nodiscard ]] constexpr size_type capacity() const noexcept
    requires requires( Storage const & s ) { s.capacity(); }
    {
        return static_cast<size_type>( storage_.capacity() );
    }

    constexpr void reserve( size_type const n ) { storage_.reserve( n ); }
    constexpr void shrink_to_fit()              { storage_.shrink_to_fit(); }

    //--------------------------------------------------------------------------
    // Element access (read-only)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr T const & operator[]( size_type const idx ) const noexcept
    {
        BOOST_ASSERT( idx < size() );
        return storage_[ idx ];
    }

    [[ nodiscard ]] constexpr T const & front() const noexcept { BOOST_ASSERT( !empty() ); return storage_.front(); }
    [[ nodiscard ]] constexpr T const & back () const noexcept { BOOST_ASSERT( !empty() ); return storage_.back (); }

    [[ nodiscard ]] constexpr T const * data() const noexcept
    requires std::ranges::contiguous_range<Storage const>
    {
        return storage_.data();
    }

    /// The underlying (always sorted) sequence
    [[ nodiscard ]] constexpr Storage const & items() const noexcept { return storage_; }

    constexpr operator std::span<T const>() const noexcept
    requires std::ranges::contiguous_range<Storage const>
    {
        return std::span<T const>{ storage_.data(), storage_.size() };
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] constexpr std::optional<size_type> index_of_key( K const & key ) const noexcept( nothrow_lookup<K> )
    {
        lookup_arg<K> k{ key };
        auto const pos{ lower_bound_index( k ) };
        if ( key_eq_at( pos, k ) )
            return pos;
        return std::nullopt;
    }

    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] constexpr T const * get_by_key( K const & key ) const noexcept( nothrow_lookup<K> )
    {
        auto const idx{ index_of_key( key ) };
        return idx ? std::addressof( storage_[ *idx ] ) : nullptr;
    }

    /// The caller must not change the element's key through the returned
    /// pointer (use retain_map for that).
    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] constexpr T * get_mutable_by_key( K const & key ) noexcept( nothrow_lookup<K> )
    {
        auto const idx{ index_of_key( key ) };
        return idx ? std::addressof( storage_[ *idx ] ) : nullptr;
    }

    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] constexpr iterator find( K const & key ) const noexcept( nothrow_lookup<K> )
    {
        auto const idx{ index_of_key( key ) };
        return idx ? make_iter( *idx ) : end();
    }

    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    [[ nodiscard ]] constexpr bool contains( K const & key ) const noexcept( nothrow_lookup<K> )
    {
        return index_of_key( key ).has_value();
    }

    //--------------------------------------------------------------------------
    // Modifiers: insert
    //
    // Throws duplicate_key (leaving the container unchanged) if an element
    // with an equivalent key is already present.
    //--------------------------------------------------------------------------
    constexpr iterator insert( value_type const & item ) { return insert_impl( value_type( item ) ); }
    constexpr iterator insert( value_type &&      item ) { return insert_impl( std::move( item ) ); }

    template <typename... Args>
    constexpr iterator emplace( Args &&... args )
    {
        return insert_impl( value_type( std::forward<Args>( args )... ) );
    }

    //--------------------------------------------------------------------------
    // Modifiers: removal
    //--------------------------------------------------------------------------
    template <LookupType<Komp::transparent_comparator, key_type> K = key_type>
    constexpr std::optional<value_type> remove_by_key( K const & key )
    {
        auto const idx{ index_of_key( key ) };
        if ( !idx )
            return std::nullopt;
        auto const pos{ storage_.begin() + static_cast<difference_type>( *idx ) };
        std::optional<value_type> removed{ std::move( *pos ) };
        storage_.erase( pos );
        return removed;
    }

    constexpr iterator erase( const_iterator const pos )
    {
        BOOST_ASSERT( pos != end() );
        return storage_.erase( pos );
    }

    constexpr void clear() noexcept { storage_.clear(); }

    template <typename Pred>
    friend constexpr size_type erase_if( ordered_vector & ov, Pred pred )
    {
        auto const old_size{ ov.size() };
        auto const new_end
        {
            std::remove_if( ov.storage_.begin(), ov.storage_.end(), [&pred]( value_type const & item ) { return pred( item ); } )
        };
        ov.storage_.erase( new_end, ov.storage_.end() );
        return static_cast<size_type>( old_size - ov.size() );
    }

    //--------------------------------------------------------------------------
    // Modifiers: bulk transform
    //
    // Hands every element over to f (by rvalue) exactly once and
    // * keeps the returned replacement, which may carry a different key, or
    // * drops the element if f returns an empty optional.
    // The survivors are then resorted and checked for duplicate keys.
    //
    // The visitation order is NOT the key order. Elements are taken out with
    // an O(1) swap-with-last removal, so f sees them in the order that
    // compaction produces (e.g. 0, 1, 7, 6, 2, 3, 5, 4 for keys 0..7 when
    // only the even ones survive).
    //
    // If f throws or the survivors contain duplicate keys the container is
    // left empty and the exception propagates.
    //--------------------------------------------------------------------------
    template <retain_map_function<value_type> F>
    constexpr void retain_map( F && f )
    {
        try
        {
            size_type cursor{ 0 };
            while ( cursor < storage_.size() )
            {
                std::optional<value_type> replacement{ std::invoke( f, swap_remove( cursor ) ) };
                if ( !replacement )
                    continue; // an unvisited element now occupies the cursor slot
                if ( cursor < storage_.size() )
                {
                    // The slot holds a not yet visited element: put the
                    // survivor in its place and move it to the back.
                    storage_.push_back( std::exchange( storage_[ cursor ], std::move( *replacement ) ) );
                }
                else
                {
                    storage_.push_back( std::move( *replacement ) );
                }
                ++cursor;
            }
            sort_and_validate();
        }
        catch ( ... )
        {
            storage_.clear();
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Extraction & observers
    //--------------------------------------------------------------------------
    constexpr Storage extract() noexcept( std::is_nothrow_move_constructible_v<Storage> )
    {
        Storage items{ std::move( storage_ ) };
        storage_.clear();
        return items;
    }

    [[ nodiscard ]] constexpr key_compare key_comp     () const noexcept { return this->comp(); }
    [[ nodiscard ]] constexpr key_of      key_extractor() const noexcept { return key_of{}; }

    //--------------------------------------------------------------------------
    // Swap & comparison
    //--------------------------------------------------------------------------
    constexpr void swap( ordered_vector & other ) noexcept( std::is_nothrow_swappable_v<Storage> && std::is_nothrow_swappable_v<Compare> )
    {
        using std::swap;
        swap( storage_, other.storage_ );
        swap( this->comp(), other.comp() );
    }
    friend constexpr void swap( ordered_vector & a, ordered_vector & b ) noexcept( noexcept( a.swap( b ) ) ) { a.swap( b ); }

    friend constexpr bool operator==( ordered_vector const & a, ordered_vector const & b ) noexcept( noexcept( std::declval<Storage const &>() == std::declval<Storage const &>() ) )
    {
        return a.storage_ == b.storage_;
    }

    friend constexpr auto operator<=>( ordered_vector const & a, ordered_vector const & b ) noexcept( noexcept( std::declval<Storage const &>() <=> std::declval<Storage const &>() ) )
    requires requires( Storage const & s ) { s <=> s; }
    {
        return a.storage_ <=> b.storage_;
    }

private:
    template <typename K>
    [[ nodiscard ]] constexpr size_type lower_bound_index( K const & key ) const
    {
        auto const it
        {
            std::lower_bound
            (
                storage_.begin(), storage_.end(), key,
                [this]( value_type const & item, K const & k ) { return this->le( Komp::key( item ), k ); }
            )
        };
        return static_cast<size_type>( it - storage_.begin() );
    }

    template <typename K>
    [[ nodiscard ]] constexpr bool key_eq_at( size_type const pos, K const & key ) const
    {
        return pos < size() && !this->le( key, Komp::key( storage_[ pos ] ) );
    }

    constexpr iterator make_iter( size_type const pos ) const noexcept
    {
        return storage_.cbegin() + static_cast<difference_type>( pos );
    }

    constexpr iterator insert_impl( value_type && item )
    {
        // ordered append (monotonically increasing keys) needs neither a
        // search nor a shift
        if ( empty() || this->le( Komp::key( storage_.back() ), Komp::key( item ) ) ) [[ likely ]]
        {
            storage_.push_back( std::move( item ) );
            return make_iter( size() - 1 );
        }
        auto const pos{ lower_bound_index( Komp::key( item ) ) };
        if ( key_eq_at( pos, Komp::key( item ) ) )
            detail::throw_duplicate_key();
        storage_.insert( storage_.begin() + static_cast<difference_type>( pos ), std::move( item ) );
        return make_iter( pos );
    }

    // O(1) unordered removal: the last element takes the vacated slot
    constexpr value_type swap_remove( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        value_type item{ std::move( storage_[ pos ] ) };
        if ( pos != size() - 1 )
            storage_[ pos ] = std::move( storage_.back() );
        storage_.pop_back();
        return item;
    }

    [[ nodiscard ]] constexpr bool has_adjacent_duplicates() const
    {
        return std::adjacent_find
        (
            storage_.begin(), storage_.end(),
            [this]( value_type const & left, value_type const & right ) { return this->eq( Komp::key( left ), Komp::key( right ) ); }
        ) != storage_.end();
    }

    [[ nodiscard ]] constexpr bool is_sorted_unique() const
    {
        return std::adjacent_find
        (
            storage_.begin(), storage_.end(),
            [this]( value_type const & left, value_type const & right ) { return !this->le( Komp::key( left ), Komp::key( right ) ); }
        ) == storage_.end();
    }

    constexpr void sort_and_validate()
    {
        this->sort( storage_.begin(), storage_.end() );
        if ( has_adjacent_duplicates() )
            detail::throw_duplicate_key();
    }

    Storage storage_;
}; // class ordered_vector

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------
