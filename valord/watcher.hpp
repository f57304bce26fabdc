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

#ifndef INC_VALORD__WATCHER_HPP
#define INC_VALORD__WATCHER_HPP

#include "config.hpp"

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace valord
{
	namespace detail
	{
		/**	The state shared between one head_publisher and its watchers: the latest published head and its version.
		 *	@tparam T The published value type.
		 */
		template <typename T>
		class head_channel final
		{
		public:
			using head_type = std::shared_ptr<const T>;
			using version_type = std::uint64_t;

			void publish(head_type head)
			{
				absl::MutexLock lock(&m_mutex);
				m_head = std::move(head);
				++m_version;
			}
			void close()
			{
				absl::MutexLock lock(&m_mutex);
				m_closed = true;
			}

			/**	Block until a version newer than seen is published or the channel closes.
			 *	@param seen The last version observed by the caller. Updated to the version returned.
			 *	@param timeout How long to wait; absl::InfiniteDuration() waits forever.
			 *	@return The new head, or nullopt on closure (with nothing newer) or timeout.
			 */
			std::optional<head_type> wait_newer(version_type& seen, const absl::Duration timeout)
			{
				const waiter w{ this, seen };
				absl::MutexLock lock(&m_mutex);
				if (!m_mutex.AwaitWithTimeout(absl::Condition(&w, &waiter::ready), timeout) || m_version == seen)
				{
					return std::nullopt;
				}
				seen = m_version;
				return m_head;
			}

			head_type latest() const
			{
				absl::MutexLock lock(&m_mutex);
				return m_head;
			}
			version_type version() const
			{
				absl::MutexLock lock(&m_mutex);
				return m_version;
			}
			bool closed() const
			{
				absl::MutexLock lock(&m_mutex);
				return m_closed;
			}

		private:
			struct waiter final
			{
				const head_channel* m_channel;
				version_type m_seen;

				bool ready() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(m_channel->m_mutex)
				{
					return m_channel->m_version != m_seen || m_channel->m_closed;
				}
			};

			mutable absl::Mutex m_mutex;
			head_type m_head ABSL_GUARDED_BY(m_mutex);
			version_type m_version ABSL_GUARDED_BY(m_mutex){ 0 };
			bool m_closed ABSL_GUARDED_BY(m_mutex){ false };
		};
	} // namespace detail

	/**	A subscription to the maximum ("head") value of a valord_map.
	 *	@details Latest-value-wins: a watcher only ever sees the most recent head at the time it wakes, so a slow watcher
	 *	may miss intermediate maxima but always observes the final one. Watchers may live on other threads than the
	 *	container; destroying a watcher simply detaches it. A moved-from watcher behaves as one whose container is gone.
	 *	@tparam T The value type of the watched container.
	 */
	template <typename T>
	class watcher final
	{
	public:
		using value_type = T;
		using head_type = std::shared_ptr<const value_type>;

		explicit watcher(std::shared_ptr<detail::head_channel<value_type>> channel)
			: m_channel{ std::move(channel) }
			, m_seen{ m_channel->version() }
		{ }
		watcher(const watcher&) = default;
		watcher(watcher&&) noexcept = default;
		watcher& operator=(const watcher&) = default;
		watcher& operator=(watcher&&) noexcept = default;
		~watcher() = default;

		/**	Wait for the head to change since this watcher last looked.
		 *	@return The new head, or nullopt once the container is gone and nothing newer was published.
		 */
		std::optional<head_type> head_changed()
		{
			return head_changed_for(absl::InfiniteDuration());
		}
		/**	Wait a bounded time for the head to change since this watcher last looked.
		 *	@param timeout The maximum time to wait.
		 *	@return The new head, or nullopt on timeout or once the container is gone.
		 */
		std::optional<head_type> head_changed_for(const absl::Duration timeout)
		{
			if (m_channel == nullptr)
			{
				return std::nullopt;
			}
			return m_channel->wait_newer(m_seen, timeout);
		}

		/**	The latest published head without waiting or marking it seen. Null until the first publication.
		 */
		head_type borrow() const
		{
			return m_channel == nullptr ? head_type{} : m_channel->latest();
		}
		bool has_changed() const
		{
			return m_channel != nullptr && m_channel->version() != m_seen;
		}
		/**	Check if the container is gone. A moved-from watcher reports itself closed.
		 */
		bool closed() const
		{
			return m_channel == nullptr || m_channel->closed();
		}

	private:
		std::shared_ptr<detail::head_channel<value_type>> m_channel;
		typename detail::head_channel<value_type>::version_type m_seen;
	};

	/**	The container side of the head channel.
	 *	@details Closes the channel on destruction, waking any watcher that is waiting.
	 *	@tparam T The published value type.
	 */
	template <typename T>
	class head_publisher final
	{
	public:
		using value_type = T;

		head_publisher()
			: m_channel{ std::make_shared<detail::head_channel<value_type>>() }
		{ }
		head_publisher(const head_publisher&) = delete;
		head_publisher(head_publisher&& other) noexcept
			: m_channel{ std::move(other.m_channel) }
		{ }
		head_publisher& operator=(const head_publisher&) = delete;
		head_publisher& operator=(head_publisher&& other) noexcept
		{
			if (this != &other)
			{
				close();
				m_channel = std::move(other.m_channel);
			}
			return *this;
		}
		~head_publisher()
		{
			close();
		}

		void publish(const value_type& head)
		{
			VALORD_ASSERT(m_channel != nullptr, "Publishing through a moved-from head_publisher.");
			m_channel->publish(std::make_shared<const value_type>(head));
		}
		void swap(head_publisher& other) noexcept
		{
			m_channel.swap(other.m_channel);
		}
		watcher<value_type> subscribe() const
		{
			VALORD_ASSERT(m_channel != nullptr, "Subscribing to a moved-from head_publisher.");
			return watcher<value_type>{ m_channel };
		}

	private:
		void close() noexcept
		{
			if (m_channel != nullptr)
			{
				m_channel->close();
			}
		}

		std::shared_ptr<detail::head_channel<value_type>> m_channel;
	};
} // namespace valord

#endif
