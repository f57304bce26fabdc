/*	BSD 3-Clause License

	Copyright (c) 2022, Paul Varga
	All rights reserved.

	Redistribution and use in source and binary forms, with or without
	modification, are permitted provided that the following conditions are met:

	1. Redistributions of source code must retain the above copyright notice, this
	   list of conditions and the following disclaimer.

	2. Redistributions in binary form must reproduce the above copyright notice,
	   this list of conditions and the following disclaimer in the documentation
	   and/or other materials provided with the distribution.

	3. Neither the name of the copyright holder nor the names of its
	   contributors may be used to endorse or promote products derived from
	   this software without specific prior written permission.

	THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
	AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
	IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
	DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
	FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
	DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
	SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
	CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
	OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
	OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#ifndef INC_VALORD__VALORD_MAP_HPP
#define INC_VALORD__VALORD_MAP_HPP

#include "config.hpp"
#include "borrow.hpp"
#include "entry.hpp"
#include "iterator.hpp"
#include "ord_by.hpp"
#include "order_index.hpp"
#include "slot_store.hpp"
#include "watcher.hpp"

#include <absl/hash/hash.h>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace valord
{
	/**	An associative container addressable by a unique key and ordered by an order key derived from each value.
	 *	@details Values live in stable slots (see slot_store). A second index maps each order key, as produced by
	 *	valord::ord_by<T>, to the set of slots currently holding a value with that key. Every read that needs ordering
	 *	walks that index; every mutation updates the slots first and then reconciles the index.
	 *
	 *	Mutation in place goes through scoped handles (raw_entry, entry, entry_sequence). A handle detaches its slot from
	 *	the order index when opened and reattaches it under the recomputed order key when released, so a handle may
	 *	change the order key freely. Only one handle may be open at a time, and nothing else may mutate the container
	 *	while a handle or a mutable sequence is alive; violations throw borrow_error.
	 *
	 *	Values whose order key can change without going through a handle (shared cells, pointers) leave the order index
	 *	stale until re_order() is called.
	 *
	 *	Every insert that raises the maximum order key publishes a copy of the new value to the container's watchers.
	 *	Move-only value types cannot be watched.
	 *	@tparam Key The key type. Must be hashable by Hash and copy constructible.
	 *	@tparam T The value type. Its order key must be copy constructible and ordered by operator<.
	 *	@tparam Hash The key hasher.
	 *	@tparam KeyEqual The key equality predicate.
	 */
	template <typename Key, typename T, typename Hash = absl::Hash<Key>, typename KeyEqual = std::equal_to<Key>>
	class valord_map final
	{
		static_assert(is_orderable_v<T>, "The order key of T must be copy constructible and comparable with operator<.");

	public:
		using key_type = Key;
		using mapped_type = T;
		using value_type = std::pair<key_type, mapped_type>;
		using size_type = std::size_t;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using order_key_type = order_key_t<mapped_type>;
		using bound_type = valord::bound<order_key_type>;
		using store_type = slot_store<key_type, mapped_type, hasher, key_equal>;
		using index_type = order_index<order_key_type, size_type>;
		using raw_entry_type = valord::raw_entry<valord_map>;
		using entry_type = valord::entry<valord_map>;
		using view_type = ordered_view<valord_map, detail::forward_direction>;
		using reverse_view_type = ordered_view<valord_map, detail::reverse_direction>;
		using const_iterator = ordered_iterator<valord_map, detail::forward_direction>;
		using const_reverse_iterator = ordered_iterator<valord_map, detail::reverse_direction>;
		using entry_sequence_type = entry_sequence<valord_map>;
		using watcher_type = watcher<mapped_type>;

		valord_map() = default;
		valord_map(std::initializer_list<value_type> init);
		template <typename InputIt>
		valord_map(InputIt first, InputIt last);
		valord_map(const valord_map&) = delete;
		valord_map(valord_map&& other);
		valord_map& operator=(const valord_map&) = delete;
		valord_map& operator=(valord_map&& other);
		~valord_map() = default;

		/**	Insert a value, or replace the value of an existing key in place and re-sort it.
		 *	@details Publishes the new value to watchers if its order key is greater than every order key present before
		 *	the call, or if the container was empty. If writing the value throws, the pair keeps its place in the order
		 *	index and a missing key is not added.
		 *	@param key The key.
		 *	@param value The value.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		void insert(key_type key, mapped_type value);

		const mapped_type* get(const key_type& key) const
		{
			return m_store.get(key);
		}
		/**	Access the value of a key.
		 *	@throws std::out_of_range If key is missing.
		 */
		const mapped_type& at(const key_type& key) const;
		bool contains(const key_type& key) const
		{
			return m_store.contains(key);
		}
		/**	Access a slot directly.
		 *	@return The slot's key/value pair, or nullptr if the slot is empty or out of range.
		 */
		const value_type* get_by_index(const size_type index) const noexcept
		{
			return m_store.get_by_index(index);
		}

		/**	Open a handle on the value of key.
		 *	@return The open handle, or nullopt if key is missing.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		std::optional<raw_entry_type> get_mut(const key_type& key);
		/**	Apply fn to the value of key, re-sorting it afterwards.
		 *	@param fn Invoked as fn(value) or fn(key, value).
		 *	@return False, without invoking fn, if key is missing.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		template <typename Fn>
		bool modify(const key_type& key, Fn&& fn);

		/**	Remove a key.
		 *	@return The removed value, or nullopt if key was missing.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		std::optional<mapped_type> remove(const key_type& key);
		/**	Remove a key.
		 *	@return The removed key/value pair, or nullopt if key was missing.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		std::optional<value_type> remove_entry(const key_type& key);

		/**	Open the entry for key, occupied or vacant.
		 *	@details For a missing key the entry reserves the slot the value will be written to. Opening the entry of the
		 *	same missing key again without writing reuses that reservation.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		entry_type entry(key_type key);

		view_type iter() const noexcept
		{
			return view_type{ *this, m_order.all() };
		}
		reverse_view_type rev_iter() const noexcept
		{
			return reverse_view_type{ *this, m_order.all() };
		}
		const_iterator begin() const
		{
			return iter().begin();
		}
		const_iterator end() const
		{
			return iter().end();
		}
		/**	The pairs whose order key lies within the bounds, ascending.
		 */
		view_type range(const bound_type& lower, const bound_type& upper) const
		{
			return view_type{ *this, m_order.range(lower, upper) };
		}
		/**	The pairs whose order key lies within [lower, upper), ascending.
		 */
		view_type range(const order_key_type& lower, const order_key_type& upper) const
		{
			return range(bound_type::included(lower), bound_type::excluded(upper));
		}
		reverse_view_type rev_range(const bound_type& lower, const bound_type& upper) const
		{
			return reverse_view_type{ *this, m_order.range(lower, upper) };
		}
		/**	Every pair sharing the minimum order key, or nothing if the container is empty.
		 */
		view_type first() const noexcept
		{
			return view_type{ *this, m_order.front_range() };
		}
		/**	Every pair sharing the maximum order key, or nothing if the container is empty.
		 */
		view_type last() const noexcept
		{
			return view_type{ *this, m_order.back_range() };
		}

		entry_sequence_type iter_mut()
		{
			return sequence<detail::forward_direction>(m_order.all(), "valord_map::iter_mut");
		}
		entry_sequence_type rev_iter_mut()
		{
			return sequence<detail::reverse_direction>(m_order.all(), "valord_map::rev_iter_mut");
		}
		entry_sequence_type range_mut(const bound_type& lower, const bound_type& upper)
		{
			return sequence<detail::forward_direction>(m_order.range(lower, upper), "valord_map::range_mut");
		}
		entry_sequence_type range_mut(const order_key_type& lower, const order_key_type& upper)
		{
			return range_mut(bound_type::included(lower), bound_type::excluded(upper));
		}
		entry_sequence_type first_mut()
		{
			return sequence<detail::forward_direction>(m_order.front_range(), "valord_map::first_mut");
		}
		entry_sequence_type last_mut()
		{
			return sequence<detail::forward_direction>(m_order.back_range(), "valord_map::last_mut");
		}

		/**	Rebuild the order index from the current values.
		 *	@details Needed only after order keys changed without going through a handle.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		void re_order();

		/**	Subscribe to maxima published by insert.
		 *	@details Watchers receive shared copies of the published values, so only copy constructible value types can
		 *	be watched. Containers of move-only values publish nothing and do not offer watch().
		 */
		template <typename U = mapped_type, typename = std::enable_if_t<std::is_copy_constructible_v<U>>>
		watcher_type watch() const
		{
			return m_head.subscribe();
		}

		size_type size() const noexcept
		{
			return m_store.size();
		}
		bool empty() const noexcept
		{
			return m_store.empty();
		}
		/**	The number of distinct order keys present.
		 */
		size_type bucket_count() const noexcept
		{
			return m_order.bucket_count();
		}
		/**	Remove every pair and release the slots. Watchers are not notified.
		 *	@throws borrow_error If a handle or mutable sequence is alive.
		 */
		void clear();
		void reserve(const size_type count)
		{
			m_store.reserve(count);
		}

		const store_type& slots() const noexcept
		{
			return m_store;
		}
		const index_type& ordering() const noexcept
		{
			return m_order;
		}

		void swap(valord_map& other);

	private:
		friend raw_entry_type;
		friend entry_type;
		friend entry_sequence_type;
		friend const_iterator;
		friend const_reverse_iterator;

		const value_type& slot_at(const size_type index) const
		{
			const value_type* const kv = m_store.get_by_index(index);
			VALORD_ASSERT(kv != nullptr, "Order index refers to an empty slot.");
			return *kv;
		}
		value_type* slot_pointer(const size_type index) noexcept
		{
			return m_store.get_by_index(index);
		}

		raw_entry_type open_entry(size_type index, bool from_sequence, const char* what);
		void commit_entry(size_type index);
		void fill_vacant(const size_type index, key_type key, mapped_type value)
		{
			m_store.fill_vacant(index, std::move(key), std::move(value));
		}
		void close_sequence() noexcept
		{
			m_borrow.close_sequence();
		}
		void detach(size_type index, const mapped_type& value);
		/**	Drop the membership an overwritten slot had before being filed under current.
		 */
		void detach_previous(size_type index, const order_key_type& previous, const order_key_type& current);

		template <typename Direction>
		entry_sequence_type sequence(typename index_type::bucket_range buckets, const char* what);

		store_type m_store;
		index_type m_order;
		borrow_state m_borrow;
		head_publisher<mapped_type> m_head;
	};

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	valord_map<Key, T, Hash, KeyEqual>::valord_map(std::initializer_list<value_type> init)
		: valord_map(init.begin(), init.end())
	{ }
	template <typename Key, typename T, typename Hash, typename KeyEqual>
	template <typename InputIt>
	valord_map<Key, T, Hash, KeyEqual>::valord_map(InputIt first, const InputIt last)
	{
		for (; first != last; ++first)
		{
			insert(first->first, first->second);
		}
	}
	template <typename Key, typename T, typename Hash, typename KeyEqual>
	valord_map<Key, T, Hash, KeyEqual>::valord_map(valord_map&& other)
		: valord_map()
	{
		swap(other);
	}
	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::operator=(valord_map&& other) -> valord_map&
	{
		if (this != &other)
		{
			// The previous contents, and their watchers' channel, are released with the temporary.
			valord_map moved{ std::move(other) };
			swap(moved);
		}
		return *this;
	}
	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::swap(valord_map& other)
	{
		m_borrow.check_unborrowed("valord_map::swap");
		other.m_borrow.check_unborrowed("valord_map::swap");
		m_store.swap(other.m_store);
		m_order.swap(other.m_order);
		m_head.swap(other.m_head);
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::insert(key_type key, mapped_type value)
	{
		m_borrow.check_unborrowed("valord_map::insert");

		const order_key_type order_key = order_key_of(value);
		const order_key_type* const previous_max = m_order.last_key();
		const bool head_changed = previous_max == nullptr || *previous_max < order_key;

		const size_type existing = m_store.find(key);
		const size_type index = existing != store_type::npos ? existing : m_store.next_index();
		std::optional<order_key_type> previous_key;
		if (existing != store_type::npos)
		{
			previous_key.emplace(order_key_of(m_store.get_by_index(existing)->second));
		}

		// File the slot under its new order key before writing, so a throwing write can be rewound.
		const bool filed = m_order.insert(order_key, index);
		try
		{
			const size_type written = m_store.allocate_or_reuse(std::move(key), std::move(value));
			VALORD_ASSERT(written == index, "Slot store wrote to an unexpected slot.");
			static_cast<void>(written);
		}
		catch (...)
		{
			if (filed)
			{
				m_order.remove(order_key, index);
			}
			throw;
		}
		if (previous_key.has_value() && filed)
		{
			detach_previous(index, *previous_key, order_key);
		}

		if constexpr (std::is_copy_constructible_v<mapped_type>)
		{
			if (head_changed)
			{
				VALORD_TRACE("head changed to slot " << index);
				m_head.publish(m_store.get_by_index(index)->second);
			}
		}
		else
		{
			static_cast<void>(head_changed);
		}
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::at(const key_type& key) const -> const mapped_type&
	{
		const mapped_type* const value = m_store.get(key);
		if VALORD_UNLIKELY(value == nullptr)
		{
			throw std::out_of_range("valord_map::at");
		}
		return *value;
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::get_mut(const key_type& key) -> std::optional<raw_entry_type>
	{
		m_borrow.check_unborrowed("valord_map::get_mut");
		const size_type index = m_store.find(key);
		if (index == store_type::npos)
		{
			return std::nullopt;
		}
		return open_entry(index, false, "valord_map::get_mut");
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	template <typename Fn>
	bool valord_map<Key, T, Hash, KeyEqual>::modify(const key_type& key, Fn&& fn)
	{
		m_borrow.check_unborrowed("valord_map::modify");
		const size_type index = m_store.find(key);
		if (index == store_type::npos)
		{
			return false;
		}
		raw_entry_type handle = open_entry(index, false, "valord_map::modify");
		if constexpr (std::is_invocable_v<Fn&, const key_type&, mapped_type&>)
		{
			const auto kv = handle.get_mut_with_key();
			fn(kv.first, kv.second);
		}
		else
		{
			fn(handle.value());
		}
		return true;
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::remove(const key_type& key) -> std::optional<mapped_type>
	{
		std::optional<value_type> kv = remove_entry(key);
		if (!kv.has_value())
		{
			return std::nullopt;
		}
		return std::move(kv->second);
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::remove_entry(const key_type& key) -> std::optional<value_type>
	{
		m_borrow.check_unborrowed("valord_map::remove");
		const size_type index = m_store.find(key);
		if (index == store_type::npos)
		{
			return std::nullopt;
		}
		detach(index, m_store.get_by_index(index)->second);
		return m_store.take_by_index(index);
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::entry(key_type key) -> entry_type
	{
		m_borrow.check_unborrowed("valord_map::entry");
		const size_type index = m_store.find(key);
		if (index != store_type::npos)
		{
			return entry_type{ open_entry(index, false, "valord_map::entry"), std::nullopt };
		}
		const size_type vacant = m_store.reserve_vacant();
		return entry_type{ open_entry(vacant, false, "valord_map::entry"), std::optional<key_type>{ std::move(key) } };
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::re_order()
	{
		m_borrow.check_unborrowed("valord_map::re_order");
		m_order.clear();
		m_store.for_each_occupied([this](const size_type index, const value_type& kv)
			{
				m_order.insert(order_key_of(kv.second), index);
			});
		VALORD_TRACE("order index rebuilt: " << m_store.size() << " slots in " << m_order.bucket_count() << " buckets");
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::clear()
	{
		m_borrow.check_unborrowed("valord_map::clear");
		m_order.clear();
		m_store.clear();
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto valord_map<Key, T, Hash, KeyEqual>::open_entry(const size_type index, const bool from_sequence, const char* const what) -> raw_entry_type
	{
		m_borrow.open_handle(index, from_sequence, what);
		if (const value_type* const kv = m_store.get_by_index(index))
		{
			detach(index, kv->second);
		}
		return raw_entry_type{ *this, index };
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::commit_entry(const size_type index)
	{
		m_borrow.close_handle(index);
		if (const value_type* const kv = m_store.get_by_index(index))
		{
			m_order.insert(order_key_of(kv->second), index);
		}
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::detach(const size_type index, const mapped_type& value)
	{
		if VALORD_UNLIKELY(!m_order.remove(order_key_of(value), index))
		{
			// The value's order key changed behind the container's back.
			VALORD_TRACE("slot " << index << " was not under its current order key");
			const bool removed = m_order.remove_any(index);
			VALORD_ASSERT(removed, "Occupied slot missing from the order index.");
			static_cast<void>(removed);
		}
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void valord_map<Key, T, Hash, KeyEqual>::detach_previous(const size_type index, const order_key_type& previous, const order_key_type& current)
	{
		const bool same = !(previous < current) && !(current < previous);
		if (!same && m_order.remove(previous, index))
		{
			return;
		}
		VALORD_TRACE("slot " << index << " was not under its previous order key");
		const bool removed = m_order.remove_any_except(index, current);
		VALORD_ASSERT(removed, "Occupied slot missing from the order index.");
		static_cast<void>(removed);
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	template <typename Direction>
	auto valord_map<Key, T, Hash, KeyEqual>::sequence(const typename index_type::bucket_range buckets, const char* const what) -> entry_sequence_type
	{
		std::vector<size_type> indices;
		const auto outer = Direction::outer(buckets.first, buckets.second);
		for (auto bucket = outer.first; bucket != outer.second; ++bucket)
		{
			for (auto it = Direction::begin(bucket->second); it != Direction::end(bucket->second); ++it)
			{
				indices.push_back(*it);
			}
		}
		m_borrow.open_sequence(what);
		return entry_sequence_type{ *this, std::move(indices) };
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void swap(valord_map<Key, T, Hash, KeyEqual>& lhs, valord_map<Key, T, Hash, KeyEqual>& rhs)
	{
		lhs.swap(rhs);
	}
} // namespace valord

#endif
