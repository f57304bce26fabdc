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

/**	Upserts and cancellations against a pre-filled book. Most upserts move an existing order to a new price.
 */
template <typename Book>
class churn_tester final
{
public:
	churn_tester(const bench::workload& w, const std::uint64_t seed)
	{
		bench::random r{ seed };
		m_book.reserve(w.m_ids);
		bench::apply(m_book, bench::make_operations(r, w, w.m_fill, 0));
		m_operations = bench::make_operations(r, w, w.m_operations, 8);
	}

	void operator()()
	{
		bench::apply(m_book, m_operations);
	}
	std::uint64_t checksum() const
	{
		return bench::checksum(m_book);
	}

private:
	Book m_book;
	std::vector<bench::operation> m_operations;
};

/**	Upserts into an empty book, all of them new ids.
 */
template <typename Book>
class fill_tester final
{
public:
	fill_tester(const bench::workload& w, const std::uint64_t seed)
	{
		bench::random r{ seed };
		m_operations.reserve(w.m_operations);
		for (std::size_t index = 0; index < w.m_operations; ++index)
		{
			m_operations.push_back({ index, bench::quote{ r.below(w.m_prices), 1 }, false });
		}
	}

	void operator()()
	{
		bench::apply(m_book, m_operations);
	}
	std::uint64_t checksum() const
	{
		return bench::checksum(m_book);
	}

private:
	Book m_book;
	std::vector<bench::operation> m_operations;
};

int main()
{
	bench::compare_books<fill_tester>("fill", bench::workload{
		/* repetitions: */ 16,
		/* ids:         */ 0,
		/* prices:      */ 10'000,
		/* fill:        */ 0,
		/* operations:  */ 500'000,
	});
	bench::compare_books<churn_tester>("churn, few ties", bench::workload{
		/* repetitions: */ 16,
		/* ids:         */ 100'000,
		/* prices:      */ 1'000'000,
		/* fill:        */ 200'000,
		/* operations:  */ 500'000,
	});
	bench::compare_books<churn_tester>("churn, many ties", bench::workload{
		/* repetitions: */ 16,
		/* ids:         */ 100'000,
		/* prices:      */ 100,
		/* fill:        */ 200'000,
		/* operations:  */ 500'000,
	});
}
