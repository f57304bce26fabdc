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

#ifndef INC_VALORD__SLOT_STORE_HPP
#define INC_VALORD__SLOT_STORE_HPP

#include "config.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/hash/hash.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace valord
{
	/**	Stable-index storage of key/value pairs with tombstone-and-recycle semantics.
	 *	@details Each slot is identified by its index into a vector that only ever grows (until clear). A slot is
	 *	either occupied by a key/value pair or empty. Removal tombstones a slot and queues its index on a FIFO free list;
	 *	the oldest tombstone is the next one reused. A hash map from key to slot index covers exactly the occupied slots.
	 *
	 *	The store also supports a "vacant reservation": the index a future write for a missing key will land on, handed
	 *	out before the value exists. The reservation is always the free list's front, appending an empty slot (and
	 *	queuing it at the front) only if nothing is free. Reserving again without writing returns the same index.
	 *
	 *	Keys are stored in both the slot and the hash map, so they must be copy constructible.
	 *	@tparam Key The key type.
	 *	@tparam T The value type.
	 *	@tparam Hash The key hasher.
	 *	@tparam KeyEqual The key equality predicate.
	 */
	template <typename Key, typename T, typename Hash = absl::Hash<Key>, typename KeyEqual = std::equal_to<Key>>
	class slot_store final
	{
	public:
		using key_type = Key;
		using mapped_type = T;
		using value_type = std::pair<key_type, mapped_type>;
		using size_type = std::size_t;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using slot_type = std::optional<value_type>;

		static_assert(std::is_copy_constructible_v<key_type>, "slot_store keeps a copy of each key in its primary index.");

		/**	The index returned by find for a missing key.
		 */
		static constexpr size_type npos = std::numeric_limits<size_type>::max();

		slot_store() = default;
		slot_store(const slot_store&) = default;
		slot_store(slot_store&&) = default;
		slot_store& operator=(const slot_store&) = default;
		slot_store& operator=(slot_store&&) = default;
		~slot_store() = default;

		/**	Write a key/value pair, reusing the key's slot if it is already present.
		 *	@details An existing value is overwritten in place; the caller drops any secondary index membership derived
		 *	from the old value. A new key lands on next_index(). If writing a new key throws, the store is left as it was.
		 *	@param key The key to write.
		 *	@param value The value to write.
		 *	@return The index of the slot now holding the pair.
		 */
		size_type allocate_or_reuse(key_type key, mapped_type value);
		/**	The index the next write of a missing key will use: the free list's front, or a new slot at the end.
		 */
		size_type next_index() const noexcept
		{
			return m_free.empty() ? m_slots.size() : m_free.front();
		}

		/**	Find the slot index of a key.
		 *	@param key The key to look up.
		 *	@return The index of the occupied slot holding key, or npos.
		 */
		size_type find(const key_type& key) const
		{
			const auto it = m_primary.find(key);
			return it == m_primary.end() ? npos : it->second;
		}
		bool contains(const key_type& key) const
		{
			return m_primary.contains(key);
		}
		const mapped_type* get(const key_type& key) const
		{
			const size_type index = find(key);
			return index == npos ? nullptr : &m_slots[index]->second;
		}
		mapped_type* get(const key_type& key)
		{
			const size_type index = find(key);
			return index == npos ? nullptr : &m_slots[index]->second;
		}
		/**	Access a slot by index.
		 *	@param index Any index; out of range and empty slots are reported as missing.
		 *	@return A pointer to the occupied slot's pair, or nullptr.
		 */
		const value_type* get_by_index(const size_type index) const noexcept
		{
			return index < m_slots.size() && m_slots[index].has_value()
				? &*m_slots[index]
				: nullptr;
		}
		value_type* get_by_index(const size_type index) noexcept
		{
			return index < m_slots.size() && m_slots[index].has_value()
				? &*m_slots[index]
				: nullptr;
		}

		/**	Remove a key, tombstoning its slot and queuing the slot index at the back of the free list.
		 *	@param key The key to remove.
		 *	@return The removed pair, or nullopt if key was missing.
		 */
		std::optional<value_type> take(const key_type& key);
		/**	Remove the pair in an occupied slot, as take does for its key.
		 *	@param index The slot to empty.
		 *	@return The removed pair, or nullopt if the slot was empty or out of range.
		 */
		std::optional<value_type> take_by_index(size_type index);

		/**	Reserve the slot the next write of a missing key will use.
		 *	@return The free list's front. If the free list was empty, a new empty slot is appended and queued at the
		 *	front first.
		 */
		size_type reserve_vacant();
		/**	Write a missing key into the slot handed out by reserve_vacant, popping the reservation from the free list.
		 *	@param index The reserved index. Must still be the free list's front.
		 *	@param key The key to write. Must not already be present.
		 *	@param value The value to write.
		 */
		void fill_vacant(size_type index, key_type key, mapped_type value);

		/**	Invoke fn(index, pair) for every occupied slot, in slot order.
		 */
		template <typename Fn>
		void for_each_occupied(Fn&& fn) const
		{
			for (size_type index = 0; index < m_slots.size(); ++index)
			{
				if (m_slots[index].has_value())
				{
					fn(index, std::as_const(*m_slots[index]));
				}
			}
		}

		/**	The logical size: slots minus free slots.
		 */
		size_type size() const noexcept
		{
			VALORD_ASSERT(m_slots.size() - m_free.size() == m_primary.size(), "Free list and primary index disagree.");
			return m_slots.size() - m_free.size();
		}
		bool empty() const noexcept
		{
			return size() == 0;
		}
		size_type slot_count() const noexcept
		{
			return m_slots.size();
		}
		size_type free_count() const noexcept
		{
			return m_free.size();
		}
		const std::deque<size_type>& free_list() const noexcept
		{
			return m_free;
		}

		void clear() noexcept
		{
			m_slots.clear();
			m_free.clear();
			m_primary.clear();
		}
		void reserve(const size_type count)
		{
			m_slots.reserve(count);
			m_primary.reserve(count);
		}

		void swap(slot_store& other) noexcept
		{
			using std::swap;
			swap(m_slots, other.m_slots);
			swap(m_free, other.m_free);
			swap(m_primary, other.m_primary);
		}

	private:
		size_type occupy(key_type key, mapped_type value);
		/**	Fill an empty slot and map key to it. Rolls the primary index back if constructing the pair throws.
		 */
		void write(size_type index, key_type key, mapped_type value);

		/**	Slot storage. Never shrinks except through clear.
		 */
		std::vector<slot_type> m_slots;

		/**	Indices of empty slots, oldest tombstone first.
		 */
		std::deque<size_type> m_free;

		/**	Key to slot index for every occupied slot.
		 */
		absl::flat_hash_map<key_type, size_type, hasher, key_equal> m_primary;
	};

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto slot_store<Key, T, Hash, KeyEqual>::allocate_or_reuse(key_type key, mapped_type value) -> size_type
	{
		const size_type existing = find(key);
		if (existing != npos)
		{
			m_slots[existing]->second = std::move(value);
			return existing;
		}
		return occupy(std::move(key), std::move(value));
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto slot_store<Key, T, Hash, KeyEqual>::occupy(key_type key, mapped_type value) -> size_type
	{
		const bool append = m_free.empty();
		const size_type index = append ? m_slots.size() : m_free.front();
		VALORD_ASSERT(append || !m_slots[index].has_value(), "Free list refers to an occupied slot.");
		if (append)
		{
			m_slots.emplace_back();
		}
		try
		{
			write(index, std::move(key), std::move(value));
		}
		catch (...)
		{
			if (append)
			{
				m_slots.pop_back();
			}
			throw;
		}
		if (!append)
		{
			m_free.pop_front();
		}
		return index;
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void slot_store<Key, T, Hash, KeyEqual>::write(const size_type index, key_type key, mapped_type value)
	{
		const auto primary = m_primary.emplace(key, index).first;
		try
		{
			m_slots[index].emplace(std::move(key), std::move(value));
		}
		catch (...)
		{
			m_primary.erase(primary);
			throw;
		}
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto slot_store<Key, T, Hash, KeyEqual>::take(const key_type& key) -> std::optional<value_type>
	{
		const auto it = m_primary.find(key);
		if (it == m_primary.end())
		{
			return std::nullopt;
		}
		const size_type index = it->second;
		m_primary.erase(it);

		std::optional<value_type> result{ std::move(m_slots[index]) };
		m_slots[index].reset();
		m_free.push_back(index);
		return result;
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto slot_store<Key, T, Hash, KeyEqual>::take_by_index(const size_type index) -> std::optional<value_type>
	{
		if (get_by_index(index) == nullptr)
		{
			return std::nullopt;
		}
		m_primary.erase(m_slots[index]->first);

		std::optional<value_type> result{ std::move(m_slots[index]) };
		m_slots[index].reset();
		m_free.push_back(index);
		return result;
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	auto slot_store<Key, T, Hash, KeyEqual>::reserve_vacant() -> size_type
	{
		if (m_free.empty())
		{
			m_free.push_front(m_slots.size());
			m_slots.emplace_back();
		}
		VALORD_ASSERT(!m_slots[m_free.front()].has_value(), "Free list refers to an occupied slot.");
		return m_free.front();
	}

	template <typename Key, typename T, typename Hash, typename KeyEqual>
	void slot_store<Key, T, Hash, KeyEqual>::fill_vacant(const size_type index, key_type key, mapped_type value)
	{
		VALORD_ASSERT(!m_free.empty() && m_free.front() == index, "Vacant reservation is no longer the free list's front.");
		VALORD_ASSERT(!m_primary.contains(key), "Filling a vacant slot with a key that is already present.");
		write(index, std::move(key), std::move(value));
		m_free.pop_front();
	}
} // namespace valord

#endif
