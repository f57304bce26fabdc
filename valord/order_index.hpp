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

#ifndef INC_VALORD__ORDER_INDEX_HPP
#define INC_VALORD__ORDER_INDEX_HPP

#include "config.hpp"

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace valord
{
	/**	One end of an order key interval: included, excluded, or unbounded.
	 *	@tparam T The order key type.
	 */
	template <typename T>
	class bound final
	{
	public:
		enum class kind
		{
			included,
			excluded,
			unbounded,
		};

		static bound included(T value)
		{
			return bound{ kind::included, std::move(value) };
		}
		static bound excluded(T value)
		{
			return bound{ kind::excluded, std::move(value) };
		}
		static bound unbounded()
		{
			return bound{ kind::unbounded, std::nullopt };
		}

		constexpr kind get_kind() const noexcept
		{
			return m_kind;
		}
		constexpr bool is_unbounded() const noexcept
		{
			return m_kind == kind::unbounded;
		}
		/**	The bounding value.
		 *	@note Undefined for an unbounded bound.
		 */
		const T& value() const
		{
			VALORD_ASSERT(m_value.has_value(), "Accessing the value of an unbounded bound.");
			return *m_value;
		}

		/**	Check a single order key against this bound used as a lower bound.
		 */
		bool admits_from_below(const T& key) const
		{
			switch (m_kind)
			{
			case kind::included: return !(key < *m_value);
			case kind::excluded: return *m_value < key;
			default: return true;
			}
		}
		/**	Check a single order key against this bound used as an upper bound.
		 */
		bool admits_from_above(const T& key) const
		{
			switch (m_kind)
			{
			case kind::included: return !(*m_value < key);
			case kind::excluded: return key < *m_value;
			default: return true;
			}
		}

	private:
		bound(const kind k, std::optional<T> value)
			: m_kind{ k }
			, m_value{ std::move(value) }
		{ }

		kind m_kind;
		std::optional<T> m_value;
	};

	/**	A sorted mapping from order key to the set of slot indices whose value currently projects onto that key.
	 *	@details Buckets are removed as soon as they become empty, so every bucket present holds at least one index.
	 *	Within a bucket indices are kept in ascending order, which is the visiting order for ties.
	 *	@tparam OrderKey The order key type. Compared with operator<.
	 *	@tparam SizeType The slot index type.
	 */
	template <typename OrderKey, typename SizeType = std::size_t>
	class order_index final
	{
	public:
		using key_type = OrderKey;
		using size_type = SizeType;
		using bound_type = bound<key_type>;
		using bucket_type = absl::btree_set<size_type>;
		using map_type = absl::btree_map<key_type, bucket_type>;
		using const_iterator = typename map_type::const_iterator;
		/**	A run of consecutive buckets, [first, second).
		 */
		using bucket_range = std::pair<const_iterator, const_iterator>;

		/**	Add a slot index to the bucket for key, creating the bucket if needed.
		 *	@details If this throws, the index is left as it was.
		 *	@return False if the bucket already held the index.
		 */
		bool insert(const key_type& key, size_type index);
		/**	Remove a slot index from the bucket for key, dropping the bucket if it empties.
		 *	@return False, changing nothing, if the index was not in that bucket.
		 */
		bool remove(const key_type& key, size_type index);
		/**	Remove a slot index from whichever bucket holds it.
		 *	@details Linear in the number of buckets. Used when a value's order key changed without the index being told.
		 *	@return False if no bucket held the index.
		 */
		bool remove_any(size_type index);
		/**	As remove_any, but leave the index in the bucket for keep.
		 */
		bool remove_any_except(size_type index, const key_type& keep);
		bool contains(const key_type& key, const size_type index) const
		{
			const auto it = m_buckets.find(key);
			return it != m_buckets.end() && it->second.contains(index);
		}

		const bucket_type* first_bucket() const noexcept
		{
			return m_buckets.empty() ? nullptr : &m_buckets.begin()->second;
		}
		const bucket_type* last_bucket() const noexcept
		{
			return m_buckets.empty() ? nullptr : &std::prev(m_buckets.end())->second;
		}
		/**	The greatest order key present.
		 *	@return A pointer to the key, or nullptr if the index is empty.
		 */
		const key_type* last_key() const noexcept
		{
			return m_buckets.empty() ? nullptr : &std::prev(m_buckets.end())->first;
		}

		bucket_range all() const noexcept
		{
			return { m_buckets.begin(), m_buckets.end() };
		}
		/**	The minimum bucket alone, or an empty run.
		 */
		bucket_range front_range() const noexcept
		{
			return m_buckets.empty()
				? bucket_range{ m_buckets.end(), m_buckets.end() }
				: bucket_range{ m_buckets.begin(), std::next(m_buckets.begin()) };
		}
		/**	The maximum bucket alone, or an empty run.
		 */
		bucket_range back_range() const noexcept
		{
			return m_buckets.empty()
				? bucket_range{ m_buckets.end(), m_buckets.end() }
				: bucket_range{ std::prev(m_buckets.end()), m_buckets.end() };
		}
		/**	The buckets whose key lies within [lower, upper] as qualified by the bounds.
		 *	@details Bounds that admit nothing, including inverted ones, produce an empty run.
		 */
		bucket_range range(const bound_type& lower, const bound_type& upper) const;

		const_iterator begin() const noexcept
		{
			return m_buckets.begin();
		}
		const_iterator end() const noexcept
		{
			return m_buckets.end();
		}
		size_type bucket_count() const noexcept
		{
			return m_buckets.size();
		}
		bool empty() const noexcept
		{
			return m_buckets.empty();
		}
		void clear() noexcept
		{
			m_buckets.clear();
		}
		void swap(order_index& other) noexcept
		{
			m_buckets.swap(other.m_buckets);
		}

	private:
		map_type m_buckets;
	};

	template <typename OrderKey, typename SizeType>
	bool order_index<OrderKey, SizeType>::insert(const key_type& key, const size_type index)
	{
		const auto bucket = m_buckets.try_emplace(key);
		try
		{
			return bucket.first->second.insert(index).second;
		}
		catch (...)
		{
			if (bucket.second)
			{
				m_buckets.erase(bucket.first);
			}
			throw;
		}
	}

	template <typename OrderKey, typename SizeType>
	bool order_index<OrderKey, SizeType>::remove(const key_type& key, const size_type index)
	{
		const auto it = m_buckets.find(key);
		if (it == m_buckets.end() || it->second.erase(index) == 0)
		{
			return false;
		}
		if (it->second.empty())
		{
			m_buckets.erase(it);
		}
		return true;
	}

	template <typename OrderKey, typename SizeType>
	bool order_index<OrderKey, SizeType>::remove_any(const size_type index)
	{
		for (auto it = m_buckets.begin(); it != m_buckets.end(); ++it)
		{
			if (it->second.erase(index) != 0)
			{
				if (it->second.empty())
				{
					m_buckets.erase(it);
				}
				return true;
			}
		}
		return false;
	}

	template <typename OrderKey, typename SizeType>
	bool order_index<OrderKey, SizeType>::remove_any_except(const size_type index, const key_type& keep)
	{
		for (auto it = m_buckets.begin(); it != m_buckets.end(); ++it)
		{
			const bool kept = !(it->first < keep) && !(keep < it->first);
			if (!kept && it->second.erase(index) != 0)
			{
				if (it->second.empty())
				{
					m_buckets.erase(it);
				}
				return true;
			}
		}
		return false;
	}

	template <typename OrderKey, typename SizeType>
	auto order_index<OrderKey, SizeType>::range(const bound_type& lower, const bound_type& upper) const -> bucket_range
	{
		using kind = typename bound_type::kind;

		if (!lower.is_unbounded() && !upper.is_unbounded())
		{
			const key_type& lo = lower.value();
			const key_type& hi = upper.value();
			const bool equivalent = !(lo < hi) && !(hi < lo);
			const bool both_included = lower.get_kind() == kind::included && upper.get_kind() == kind::included;
			if (hi < lo || (equivalent && !both_included))
			{
				return { m_buckets.end(), m_buckets.end() };
			}
		}

		const_iterator first = m_buckets.begin();
		if (lower.get_kind() == kind::included)
		{
			first = m_buckets.lower_bound(lower.value());
		}
		else if (lower.get_kind() == kind::excluded)
		{
			first = m_buckets.upper_bound(lower.value());
		}

		const_iterator last = m_buckets.end();
		if (upper.get_kind() == kind::included)
		{
			last = m_buckets.upper_bound(upper.value());
		}
		else if (upper.get_kind() == kind::excluded)
		{
			last = m_buckets.lower_bound(upper.value());
		}
		return { first, last };
	}
} // namespace valord

#endif
