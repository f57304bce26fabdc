/*	BSD 3-Clause License

	Copyright (c) 2024, Paul Varga
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

#ifndef INC_VALORD__BENCH_UTILS_HPP
#define INC_VALORD__BENCH_UTILS_HPP

#include <valord/valord_map.hpp>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(__GNUC__) || defined(__llvm__)
	#ifndef NDEBUG
	#pragma GCC warning "Debugging enabled."
	#endif // !NDEBUG
#endif // __GNUC__ || __llvm__

namespace bench
{
	using clock = std::chrono::steady_clock;

	/**	splitmix64, seeded per repetition so that every container sees the same workload.
	 */
	class random final
	{
	public:
		explicit random(const std::uint64_t seed) noexcept
			: m_state{ seed }
		{ }

		std::uint64_t next() noexcept
		{
			std::uint64_t result{ m_state += 0x9e3779b97f4a7c15 };
			result = (result ^ (result >> 30)) * 0xbf58476d1ce4e5b9;
			result = (result ^ (result >> 27)) * 0x94d049bb133111eb;
			return result ^ (result >> 31);
		}
		std::uint64_t below(const std::uint64_t bound) noexcept
		{
			return next() % bound;
		}

	private:
		std::uint64_t m_state;
	};

	/**	A resting order: ordered by price, with a quantity that plays no part in ordering.
	 */
	struct quote
	{
		std::uint64_t m_price;
		std::uint64_t m_quantity;

		const std::uint64_t& ord_by() const noexcept
		{
			return m_price;
		}
	};

	using order_id = std::uint64_t;
	using valord_book = valord::valord_map<order_id, quote>;

	/**	The hand-maintained equivalent of a valord_map: orders by id, and a price to id multimap updated alongside.
	 *	@tparam Primary An unordered map template, instantiated as Primary<order_id, quote>.
	 *	@tparam Ordered An ordered multimap template, instantiated as Ordered<price, order_id>.
	 */
	template <template <typename...> class Primary, template <typename...> class Ordered>
	class dual_index_book final
	{
	public:
		using price_type = std::uint64_t;

		void insert(const order_id id, const quote& value)
		{
			const auto result = m_orders.try_emplace(id, value);
			if (!result.second)
			{
				unlink(id, result.first->second.m_price);
				result.first->second = value;
			}
			m_by_price.emplace(value.m_price, id);
		}
		bool remove(const order_id id)
		{
			const auto it = m_orders.find(id);
			if (it == m_orders.end())
			{
				return false;
			}
			unlink(id, it->second.m_price);
			m_orders.erase(it);
			return true;
		}
		std::size_t size() const noexcept
		{
			return m_orders.size();
		}
		void reserve(const std::size_t count)
		{
			m_orders.reserve(count);
		}

		template <typename Fn>
		void for_each_ordered(Fn&& fn) const
		{
			visit(m_by_price.begin(), m_by_price.end(), fn);
		}
		/**	Visit the orders priced within [low, high).
		 */
		template <typename Fn>
		void for_each_in(const price_type low, const price_type high, Fn&& fn) const
		{
			if (low < high)
			{
				visit(m_by_price.lower_bound(low), m_by_price.lower_bound(high), fn);
			}
		}

	private:
		template <typename Iterator, typename Fn>
		void visit(Iterator first, const Iterator last, Fn& fn) const
		{
			for (; first != last; ++first)
			{
				fn(first->second, m_orders.find(first->second)->second);
			}
		}
		void unlink(const order_id id, const price_type price)
		{
			auto [first, last] = m_by_price.equal_range(price);
			for (; first != last; ++first)
			{
				if (first->second == id)
				{
					m_by_price.erase(first);
					return;
				}
			}
		}

		Primary<order_id, quote> m_orders;
		Ordered<price_type, order_id> m_by_price;
	};

	using std_book = dual_index_book<std::unordered_map, std::multimap>;
	using absl_book = dual_index_book<absl::flat_hash_map, absl::btree_multimap>;

	template <typename Fn>
	void for_each_ordered(const valord_book& book, Fn&& fn)
	{
		for (const auto& kv : book.iter())
		{
			fn(kv.first, kv.second);
		}
	}
	template <template <typename...> class Primary, template <typename...> class Ordered, typename Fn>
	void for_each_ordered(const dual_index_book<Primary, Ordered>& book, Fn&& fn)
	{
		book.for_each_ordered(fn);
	}
	template <typename Fn>
	void for_each_in(const valord_book& book, const std::uint64_t low, const std::uint64_t high, Fn&& fn)
	{
		for (const auto& kv : book.range(low, high))
		{
			fn(kv.first, kv.second);
		}
	}
	template <template <typename...> class Primary, template <typename...> class Ordered, typename Fn>
	void for_each_in(const dual_index_book<Primary, Ordered>& book, const std::uint64_t low, const std::uint64_t high, Fn&& fn)
	{
		book.for_each_in(low, high, fn);
	}

	template <typename Book>
	struct book_name;
	template <>
	struct book_name<valord_book>
	{
		static constexpr const char* value = "valord::valord_map";
	};
	template <>
	struct book_name<std_book>
	{
		static constexpr const char* value = "std::unordered_map + std::multimap";
	};
	template <>
	struct book_name<absl_book>
	{
		static constexpr const char* value = "absl::flat_hash_map + absl::btree_multimap";
	};

	/**	The shape of a benchmark run.
	 */
	struct workload
	{
		const std::size_t m_repetitions;
		/**	Distinct order ids.
		 */
		const std::size_t m_ids;
		/**	Distinct prices. Fewer prices mean more ties.
		 */
		const std::size_t m_prices;
		/**	Upserts applied before timing starts.
		 */
		const std::size_t m_fill;
		const std::size_t m_operations;

		friend std::ostream& operator<<(std::ostream& ostr, const workload& w)
		{
			return ostr << w.m_repetitions << " repetitions, "
				<< w.m_ids << " ids, "
				<< w.m_prices << " prices, "
				<< w.m_fill << " pre-filled, "
				<< w.m_operations << " operations";
		}
	};

	struct operation
	{
		order_id m_id;
		quote m_quote;
		bool m_cancel;
	};

	/**	Generate count operations, cancelling one in every cancel_every (never if zero).
	 */
	inline std::vector<operation> make_operations(random& r, const workload& w, const std::size_t count, const std::size_t cancel_every)
	{
		std::vector<operation> result;
		result.reserve(count);
		for (std::size_t index = 0; index < count; ++index)
		{
			const order_id id = r.below(w.m_ids);
			const quote value{ r.below(w.m_prices), 1 + r.below(1'000) };
			const bool cancel = cancel_every != 0 && r.below(cancel_every) == 0;
			result.push_back({ id, value, cancel });
		}
		return result;
	}

	template <typename Book>
	void apply(Book& book, const std::vector<operation>& operations)
	{
		for (const operation& op : operations)
		{
			if (op.m_cancel)
			{
				book.remove(op.m_id);
			}
			else
			{
				book.insert(op.m_id, op.m_quote);
			}
		}
	}

	/**	Fold a book's contents, walked in price order, into one number.
	 *	@details Ties may be visited in any order, so only order-insensitive sums are taken, plus a count of price
	 *	inversions (zero for a correctly ordered book).
	 */
	template <typename Book>
	std::uint64_t checksum(const Book& book)
	{
		std::uint64_t ids = 0;
		std::uint64_t quantities = 0;
		std::uint64_t inversions = 0;
		std::optional<std::uint64_t> previous;
		for_each_ordered(book, [&](const order_id id, const quote& value)
			{
				ids += id;
				quantities += value.m_quantity * (value.m_price + 1);
				inversions += previous.has_value() && value.m_price < *previous ? 1 : 0;
				previous = value.m_price;
			});
		return ((book.size() * 1'000'003 + ids) * 1'000'003 + quantities) * 1'000'003 + inversions;
	}

	/**	Format n with thousands separators.
	 */
	inline std::string grouped(const std::uint64_t n)
	{
		std::string digits = std::to_string(n);
		for (std::size_t pos = digits.size(); pos > 3; pos -= 3)
		{
			digits.insert(pos - 3, 1, ',');
		}
		return digits;
	}

	/**	Run Tester<Book> for every book over the same workload and print min/avg/max wall time per book.
	 *	@details Each repetition constructs a fresh tester (untimed), times its operator(), and then checks its
	 *	checksum() against the first one seen. A mismatch means the books disagree about the result.
	 *	@tparam Tester A class template constructible from (const workload&, seed), with operator() and checksum().
	 */
	template <template <typename Book> class Tester, typename... Books>
	void compare(const char* const title, const workload& w)
	{
		std::cout << title << ": " << w << '\n';
		std::optional<std::uint64_t> expected;
		const auto run = [&w, &expected](const char* const name, auto make)
		{
			clock::duration total{};
			clock::duration shortest = clock::duration::max();
			clock::duration longest{};
			bool consistent = true;
			for (std::size_t repetition = 0; repetition < w.m_repetitions; ++repetition)
			{
				auto tester = make(repetition);
				const clock::time_point before = clock::now();
				tester();
				const clock::duration elapsed = clock::now() - before;

				total += elapsed;
				shortest = std::min(shortest, elapsed);
				longest = std::max(longest, elapsed);

				const std::uint64_t sum = tester.checksum();
				if (!expected.has_value())
				{
					expected = sum;
				}
				consistent = consistent && sum == *expected;
			}
			const auto ns = [](const clock::duration d)
			{
				return grouped(static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count())) + " ns";
			};
			std::cout << '\t' << name << (consistent ? "" : " (checksum mismatch)") << '\n'
				<< "\t\tavg: " << ns(total / std::max<std::size_t>(w.m_repetitions, 1)) << '\n'
				<< "\t\tmin: " << ns(shortest) << '\n'
				<< "\t\tmax: " << ns(longest) << '\n';
		};
		(run(book_name<Books>::value, [&w](const std::size_t repetition)
			{
				return Tester<Books>{ w, 0x2a4e'fd97'acc0'935b + repetition };
			}), ...);
		std::cout << std::flush;
	}

	/**	compare() across the two hand-maintained baselines and valord_map.
	 */
	template <template <typename Book> class Tester>
	void compare_books(const char* const title, const workload& w)
	{
		compare<Tester, std_book, absl_book, valord_book>(title, w);
	}
} // namespace bench

#endif
