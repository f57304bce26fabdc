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

#ifndef INC_VALORD__ENTRY_HPP
#define INC_VALORD__ENTRY_HPP

#include "config.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace valord
{
	template <typename Map>
	class entry;

	/**	A scoped, exclusive accessor to one slot of a valord_map.
	 *	@details While a raw_entry is open its slot is detached from the container's order index, so the value may be
	 *	mutated freely, order key included. Releasing the handle (explicitly, or by destruction on any exit path)
	 *	recomputes the order key and reattaches the slot. A handle bound to a still-vacant slot reattaches nothing.
	 *
	 *	Only one handle may be open on a container at a time; see borrow_error.
	 *	@tparam Map The owning container type.
	 */
	template <typename Map>
	class raw_entry final
	{
	public:
		using map_type = Map;
		using key_type = typename map_type::key_type;
		using mapped_type = typename map_type::mapped_type;
		using value_type = typename map_type::value_type;
		using size_type = typename map_type::size_type;

		raw_entry(const raw_entry&) = delete;
		raw_entry(raw_entry&& other) noexcept
			: m_map{ std::exchange(other.m_map, nullptr) }
			, m_index{ other.m_index }
		{ }
		raw_entry& operator=(const raw_entry&) = delete;
		raw_entry& operator=(raw_entry&& other)
		{
			if (this != &other)
			{
				release();
				m_map = std::exchange(other.m_map, nullptr);
				m_index = other.m_index;
			}
			return *this;
		}
		~raw_entry()
		{
			release();
		}

		/**	Check if the slot holds a value.
		 *	@return False for a vacant handle that was never written, or a released handle.
		 */
		bool occupied() const noexcept
		{
			return m_map != nullptr && m_map->slot_pointer(m_index) != nullptr;
		}
		/**	Check if the handle still holds its slot.
		 */
		bool is_open() const noexcept
		{
			return m_map != nullptr;
		}
		constexpr size_type index() const noexcept
		{
			return m_index;
		}

		const key_type& key() const
		{
			return pair().first;
		}
		mapped_type& value()
		{
			return pair().second;
		}
		const mapped_type& value() const
		{
			return pair().second;
		}
		mapped_type& operator*()
		{
			return value();
		}
		const mapped_type& operator*() const
		{
			return value();
		}
		mapped_type* operator->()
		{
			return &value();
		}
		const mapped_type* operator->() const
		{
			return &value();
		}
		/**	Mutable access to the value alongside its (immutable) key.
		 */
		std::pair<const key_type&, mapped_type&> get_mut_with_key()
		{
			value_type& kv = pair();
			return { kv.first, kv.second };
		}

		/**	Reattach the slot now instead of at destruction. Idempotent.
		 */
		void release()
		{
			if (m_map != nullptr)
			{
				std::exchange(m_map, nullptr)->commit_entry(m_index);
			}
		}

	private:
		friend map_type;
		friend class entry<map_type>;

		raw_entry(map_type& map, const size_type index) noexcept
			: m_map{ &map }
			, m_index{ index }
		{ }

		value_type& pair() const
		{
			VALORD_ASSERT(m_map != nullptr, "Accessing a released raw_entry.");
			value_type* const kv = m_map->slot_pointer(m_index);
			VALORD_ASSERT(kv != nullptr, "Accessing the value of a vacant raw_entry.");
			return *kv;
		}

		map_type* m_map;
		size_type m_index;
	};

	/**	The result of valord_map::entry: an open handle on the key's slot, occupied or vacant.
	 *	@details A vacant entry holds a reserved slot and the key, and writes both on the first or_insert* call. The
	 *	references returned by or_insert* stay valid while the entry is alive; mutations through them are committed to
	 *	the order index when the entry is released.
	 *	@tparam Map The owning container type.
	 */
	template <typename Map>
	class entry final
	{
	public:
		using map_type = Map;
		using key_type = typename map_type::key_type;
		using mapped_type = typename map_type::mapped_type;
		using handle_type = raw_entry<map_type>;

		entry(const entry&) = delete;
		entry(entry&&) = default;
		entry& operator=(const entry&) = delete;
		entry& operator=(entry&&) = default;
		~entry() = default;

		bool is_occupied() const noexcept
		{
			return !m_vacant_key.has_value();
		}
		bool is_vacant() const noexcept
		{
			return m_vacant_key.has_value();
		}
		const key_type& key() const
		{
			return m_vacant_key.has_value() ? *m_vacant_key : m_handle.key();
		}
		handle_type& handle() noexcept
		{
			return m_handle;
		}

		/**	Write value if the entry is vacant.
		 *	@return A reference to the entry's value.
		 */
		mapped_type& or_insert(mapped_type value)
		{
			return fill([&value](const key_type&) -> mapped_type&& { return std::move(value); });
		}
		/**	Write the result of make() if the entry is vacant. make is not called otherwise.
		 *	@return A reference to the entry's value.
		 */
		template <typename Make>
		mapped_type& or_insert_with(Make&& make)
		{
			return fill([&make](const key_type&) { return std::forward<Make>(make)(); });
		}
		/**	Write the result of make(key) if the entry is vacant. make is not called otherwise.
		 *	@return A reference to the entry's value.
		 */
		template <typename Make>
		mapped_type& or_insert_with_key(Make&& make)
		{
			return fill([&make](const key_type& key) { return std::forward<Make>(make)(key); });
		}
		/**	Write a value-initialized value if the entry is vacant.
		 *	@return A reference to the entry's value.
		 */
		mapped_type& or_default()
		{
			static_assert(std::is_default_constructible_v<mapped_type>, "or_default requires a default constructible value type.");
			return fill([](const key_type&) { return mapped_type(); });
		}

		/**	Apply fn to the value if the entry is occupied.
		 *	@return This entry, for chaining into an or_insert* call.
		 */
		template <typename Fn>
		entry& and_modify(Fn&& fn) &
		{
			if (is_occupied())
			{
				std::forward<Fn>(fn)(m_handle.value());
			}
			return *this;
		}
		template <typename Fn>
		entry&& and_modify(Fn&& fn) &&
		{
			return std::move(and_modify(std::forward<Fn>(fn)));
		}

		/**	Release the underlying handle now instead of at destruction.
		 */
		void release()
		{
			m_handle.release();
		}

	private:
		friend map_type;

		entry(handle_type handle, std::optional<key_type> vacant_key) noexcept
			: m_handle{ std::move(handle) }
			, m_vacant_key{ std::move(vacant_key) }
		{ }

		template <typename Make>
		mapped_type& fill(Make&& make)
		{
			if (m_vacant_key.has_value())
			{
				VALORD_ASSERT(m_handle.is_open(), "Writing through a released entry.");
				mapped_type value(std::forward<Make>(make)(std::as_const(*m_vacant_key)));
				m_handle.m_map->fill_vacant(m_handle.m_index, std::move(*m_vacant_key), std::move(value));
				m_vacant_key.reset();
			}
			return m_handle.value();
		}

		handle_type m_handle;

		/**	The key to write, engaged while the entry is vacant.
		 */
		std::optional<key_type> m_vacant_key;
	};
} // namespace valord

#endif
