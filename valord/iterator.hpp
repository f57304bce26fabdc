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

#ifndef INC_VALORD__ITERATOR_HPP
#define INC_VALORD__ITERATOR_HPP

#include "config.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace valord
{
	template <typename Map>
	class raw_entry;
	template <typename Map, typename Direction>
	class ordered_view;

	namespace detail
	{
		/**	Walks buckets from the smallest order key up, and each bucket's slot indices in ascending order.
		 */
		struct forward_direction final
		{
			template <typename OuterIterator>
			static std::pair<OuterIterator, OuterIterator> outer(const OuterIterator first, const OuterIterator last) noexcept
			{
				return { first, last };
			}
			template <typename Bucket>
			static auto begin(const Bucket& bucket) noexcept
			{
				return bucket.begin();
			}
			template <typename Bucket>
			static auto end(const Bucket& bucket) noexcept
			{
				return bucket.end();
			}
		};

		/**	The exact reverse of forward_direction: largest order key first, and each bucket's slot indices descending.
		 */
		struct reverse_direction final
		{
			template <typename OuterIterator>
			static auto outer(const OuterIterator first, const OuterIterator last) noexcept
			{
				return std::make_pair(std::make_reverse_iterator(last), std::make_reverse_iterator(first));
			}
			template <typename Bucket>
			static auto begin(const Bucket& bucket) noexcept
			{
				return bucket.rbegin();
			}
			template <typename Bucket>
			static auto end(const Bucket& bucket) noexcept
			{
				return bucket.rend();
			}
		};
	} // namespace detail

	/**	A constant iterator over a run of order index buckets, flattening each bucket and dereferencing every slot index
	 *	through the owning container's slot store.
	 *	@details Invalidated by any mutation of the container, including opening an entry handle.
	 *	@tparam Map The owning container type.
	 *	@tparam Direction detail::forward_direction or detail::reverse_direction.
	 */
	template <typename Map, typename Direction>
	class ordered_iterator final
	{
	private:
		using index_type = typename Map::index_type;
		using bucket_iterator = typename index_type::const_iterator;
		using outer_iterator = typename decltype(Direction::outer(std::declval<bucket_iterator>(), std::declval<bucket_iterator>()))::first_type;
		using inner_iterator = decltype(Direction::begin(std::declval<const typename index_type::bucket_type&>()));

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = typename Map::value_type;
		using difference_type = std::ptrdiff_t;
		using reference = const value_type&;
		using pointer = const value_type*;

		ordered_iterator() = default;

		reference operator*() const
		{
			VALORD_ASSERT(m_map != nullptr && m_outer != m_last, "Dereferencing an end or default ordered_iterator.");
			return m_map->slot_at(*m_inner);
		}
		pointer operator->() const
		{
			return std::addressof(this->operator*());
		}

		ordered_iterator& operator++()
		{
			VALORD_ASSERT(m_outer != m_last, "Incrementing an end ordered_iterator.");
			++m_inner;
			if (m_inner == Direction::end(m_outer->second))
			{
				++m_outer;
				settle();
			}
			return *this;
		}
		ordered_iterator operator++(int)
		{
			const ordered_iterator result = *this;
			++(*this);
			return result;
		}

		friend bool operator==(const ordered_iterator& lhs, const ordered_iterator& rhs)
		{
			return lhs.m_outer == rhs.m_outer
				&& (lhs.m_outer == lhs.m_last || lhs.m_inner == rhs.m_inner);
		}
		friend bool operator!=(const ordered_iterator& lhs, const ordered_iterator& rhs)
		{
			return !(lhs == rhs);
		}

	private:
		friend class ordered_view<Map, Direction>;

		ordered_iterator(const Map& map, const outer_iterator position, const outer_iterator last)
			: m_map{ &map }
			, m_outer{ position }
			, m_last{ last }
			, m_inner{}
		{
			settle();
		}

		void settle()
		{
			// Buckets are never empty, so the first index of the next bucket is always valid.
			if (m_outer != m_last)
			{
				m_inner = Direction::begin(m_outer->second);
			}
		}

		const Map* m_map{ nullptr };
		outer_iterator m_outer{};
		outer_iterator m_last{};
		inner_iterator m_inner{};
	};

	/**	A lazy, restartable view of a run of order index buckets, yielding key/value pairs in order key order.
	 *	@tparam Map The owning container type.
	 *	@tparam Direction detail::forward_direction or detail::reverse_direction.
	 */
	template <typename Map, typename Direction>
	class ordered_view final
	{
	private:
		using index_type = typename Map::index_type;
		using bucket_range = typename index_type::bucket_range;

	public:
		using iterator = ordered_iterator<Map, Direction>;
		using const_iterator = iterator;
		using value_type = typename Map::value_type;
		using size_type = typename Map::size_type;

		ordered_view(const Map& map, const bucket_range buckets) noexcept
			: m_map{ &map }
			, m_buckets{ buckets }
		{ }

		iterator begin() const
		{
			const auto outer = Direction::outer(m_buckets.first, m_buckets.second);
			return iterator{ *m_map, outer.first, outer.second };
		}
		iterator end() const
		{
			const auto outer = Direction::outer(m_buckets.first, m_buckets.second);
			return iterator{ *m_map, outer.second, outer.second };
		}

		bool empty() const noexcept
		{
			return m_buckets.first == m_buckets.second;
		}
		/**	Count the pairs in the view.
		 *	@note Linear in the number of buckets covered.
		 */
		size_type size() const
		{
			size_type result = 0;
			for (auto it = m_buckets.first; it != m_buckets.second; ++it)
			{
				result += it->second.size();
			}
			return result;
		}

	private:
		const Map* m_map;
		bucket_range m_buckets;
	};

	/**	A lazy sequence of entry handles over a snapshot of slot indices taken when the sequence was created.
	 *	@details The sequence holds its container exclusively for its whole lifetime: other mutations of the container
	 *	are rejected with borrow_error until the sequence is destroyed. Handles are opened one at a time, and opening the
	 *	next one while the previous is still alive is also rejected. Mutating an order key through a handle does not
	 *	change which slots the sequence visits.
	 *	@tparam Map The owning container type.
	 */
	template <typename Map>
	class entry_sequence final
	{
	public:
		using handle_type = raw_entry<Map>;
		using size_type = typename Map::size_type;

		/**	An input iterator over the sequence for use with range-based for.
		 *	@details Dereferencing opens the handle for the current position; it must be released (go out of scope) before
		 *	the next dereference.
		 */
		class iterator final
		{
		public:
			using iterator_category = std::input_iterator_tag;
			using value_type = handle_type;
			using difference_type = std::ptrdiff_t;
			using reference = handle_type;
			using pointer = void;

			iterator() = default;

			handle_type operator*() const
			{
				return m_sequence->open_current();
			}
			iterator& operator++()
			{
				m_sequence->advance();
				return *this;
			}

			friend bool operator==(const iterator& lhs, const iterator& rhs) noexcept
			{
				return lhs.done() == rhs.done();
			}
			friend bool operator!=(const iterator& lhs, const iterator& rhs) noexcept
			{
				return lhs.done() != rhs.done();
			}

		private:
			friend class entry_sequence;

			explicit iterator(entry_sequence* const sequence) noexcept
				: m_sequence{ sequence }
			{ }

			bool done() const noexcept
			{
				return m_sequence == nullptr || m_sequence->remaining() == 0;
			}

			entry_sequence* m_sequence{ nullptr };
		};

		entry_sequence(const entry_sequence&) = delete;
		entry_sequence(entry_sequence&& other) noexcept
			: m_map{ std::exchange(other.m_map, nullptr) }
			, m_indices{ std::move(other.m_indices) }
			, m_cursor{ other.m_cursor }
		{ }
		entry_sequence& operator=(const entry_sequence&) = delete;
		entry_sequence& operator=(entry_sequence&&) = delete;
		~entry_sequence()
		{
			if (m_map != nullptr)
			{
				m_map->close_sequence();
			}
		}

		/**	Open the handle for the next slot.
		 *	@return The handle, or nullopt once the snapshot is exhausted.
		 *	@throws borrow_error If the previously returned handle is still open.
		 */
		std::optional<handle_type> next()
		{
			if (remaining() == 0)
			{
				return std::nullopt;
			}
			std::optional<handle_type> result{ open_current() };
			advance();
			return result;
		}

		iterator begin() noexcept
		{
			return iterator{ this };
		}
		iterator end() noexcept
		{
			return iterator{};
		}

		size_type remaining() const noexcept
		{
			return m_indices.size() - m_cursor;
		}

	private:
		friend Map;

		entry_sequence(Map& map, std::vector<size_type> indices) noexcept
			: m_map{ &map }
			, m_indices{ std::move(indices) }
			, m_cursor{ 0 }
		{ }

		handle_type open_current()
		{
			VALORD_ASSERT(m_map != nullptr && m_cursor < m_indices.size(), "Opening past the end of an entry_sequence.");
			return m_map->open_entry(m_indices[m_cursor], true, "valord::entry_sequence");
		}
		void advance() noexcept
		{
			VALORD_ASSERT(m_cursor < m_indices.size(), "Advancing past the end of an entry_sequence.");
			++m_cursor;
		}

		Map* m_map;
		std::vector<size_type> m_indices;
		size_type m_cursor;
	};
} // namespace valord

#endif
