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

#ifndef INC_VALORD__BORROW_HPP
#define INC_VALORD__BORROW_HPP

#include "config.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace valord
{
	/**	Thrown when a valord_map is asked to open a second entry handle, or to mutate itself, while an entry handle or a
	 *	mutable entry sequence is still alive.
	 *	@details The request is rejected before any state changes, so the container stays consistent.
	 */
	class borrow_error : public std::logic_error
	{
	public:
		using std::logic_error::logic_error;
	};

	/**	Tracks the exclusive borrows currently held on one container.
	 *	@details A container has at most one open entry handle (bound to a slot index) at a time. Mutable entry
	 *	sequences additionally hold the container for their whole lifetime so that nothing but their own handles may
	 *	touch it.
	 */
	class borrow_state final
	{
	public:
		using size_type = std::size_t;

		static constexpr size_type no_slot = std::numeric_limits<size_type>::max();

		borrow_state() = default;
		borrow_state(const borrow_state&) = delete;
		borrow_state& operator=(const borrow_state&) = delete;

		/**	Throw unless nothing borrows the container.
		 *	@param what The operation being attempted, used in the exception message.
		 */
		void check_unborrowed(const char* const what) const
		{
			if VALORD_UNLIKELY(m_open_slot != no_slot)
			{
				throw borrow_error(std::string(what) + ": an entry handle is open on slot " + std::to_string(m_open_slot));
			}
			if VALORD_UNLIKELY(m_sequences != 0)
			{
				throw borrow_error(std::string(what) + ": a mutable entry sequence is alive");
			}
		}

		/**	Record a newly opened entry handle.
		 *	@param index The slot the handle is bound to.
		 *	@param from_sequence True if a mutable entry sequence is opening the handle for one of its own elements.
		 *	@param what The operation being attempted, used in the exception message.
		 */
		void open_handle(const size_type index, const bool from_sequence, const char* const what)
		{
			if (from_sequence)
			{
				if VALORD_UNLIKELY(m_open_slot != no_slot)
				{
					throw borrow_error(std::string(what) + ": the previous entry handle on slot " + std::to_string(m_open_slot) + " is still open");
				}
			}
			else
			{
				check_unborrowed(what);
			}
			m_open_slot = index;
		}
		void close_handle(const size_type index) noexcept
		{
			VALORD_ASSERT(m_open_slot == index, "Closing an entry handle that was not the open one.");
			m_open_slot = no_slot;
		}

		void open_sequence(const char* const what)
		{
			check_unborrowed(what);
			++m_sequences;
		}
		void close_sequence() noexcept
		{
			VALORD_ASSERT(m_sequences > 0, "Closing a mutable entry sequence that was never opened.");
			--m_sequences;
		}

		constexpr bool handle_open() const noexcept
		{
			return m_open_slot != no_slot;
		}
		constexpr size_type open_slot() const noexcept
		{
			return m_open_slot;
		}
		constexpr bool borrowed() const noexcept
		{
			return m_open_slot != no_slot || m_sequences != 0;
		}

	private:
		size_type m_open_slot{ no_slot };
		size_type m_sequences{ 0 };
	};
} // namespace valord

#endif
