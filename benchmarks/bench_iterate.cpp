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

#include "bench_utils.hpp"

#include <vector>

/**	Walks of a pre-filled book in price order, front to back.
 */
template <typename Book>
class walk_tester final
{
public:
	walk_tester(const bench::workload& w, const std::uint64_t seed)
		: m_walks{ w.m_operations }
	{
		bench::random r{ seed };
		m_book.reserve(w.m_ids);
		bench::apply(m_book, bench::make_operations(r, w, w.m_fill, 0));
	}

	void operator()()
	{
		for (std::size_t walk = 0; walk < m_walks; ++walk)
		{
			bench::for_each_ordered(m_book, [this](const bench::order_id, const bench::quote& value)
				{
					m_volume += value.m_quantity;
				});
		}
	}
	std::uint64_t checksum() const
	{
		return bench::checksum(m_book) ^ m_volume;
	}

private:
	Book m_book;
	std::size_t m_walks;
	std::uint64_t m_volume{ 0 };
};

/**	Price band queries, [low, low + band), against a pre-filled book.
 */
template <typename Book>
class band_tester final
{
public:
	static constexpr std::uint64_t band = 50;

	band_tester(const bench::workload& w, const std::uint64_t seed)
	{
		bench::random r{ seed };
		m_book.reserve(w.m_ids);
		bench::apply(m_book, bench::make_operations(r, w, w.m_fill, 0));
		m_lows.reserve(w.m_operations);
		for (std::size_t index = 0; index < w.m_operations; ++index)
		{
			m_lows.push_back(r.below(w.m_prices));
		}
	}

	void operator()()
	{
		for (const std::uint64_t low : m_lows)
		{
			bench::for_each_in(m_book, low, low + band, [this](const bench::order_id, const bench::quote& value)
				{
					m_volume += value.m_quantity;
				});
		}
	}
	std::uint64_t checksum() const
	{
		return bench::checksum(m_book) ^ m_volume;
	}

private:
	Book m_book;
	std::vector<std::uint64_t> m_lows;
	std::uint64_t m_volume{ 0 };
};

int main()
{
	const bench::workload book{
		/* repetitions: */ 16,
		/* ids:         */ 200'000,
		/* prices:      */ 20'000,
		/* fill:        */ 400'000,
		/* operations:  */ 8,
	};
	bench::compare_books<walk_tester>("ordered walk", book);

	const bench::workload bands{
		/* repetitions: */ 16,
		/* ids:         */ 200'000,
		/* prices:      */ 20'000,
		/* fill:        */ 400'000,
		/* operations:  */ 20'000,
	};
	bench::compare_books<band_tester>("price bands", bands);
}
