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

#include <valord/valord_map.hpp>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

namespace
{
	struct person
	{
		int m_age;
		std::string m_name;

		const int& ord_by() const noexcept
		{
			return m_age;
		}
	};

	std::ostream& operator<<(std::ostream& ostr, const person& p)
	{
		return ostr << p.m_name << " (" << p.m_age << ')';
	}

	template <typename View>
	void print(const char* const label, const View& view)
	{
		std::cout << label << ':';
		for (const auto& [id, p] : view)
		{
			std::cout << ' ' << id << '=' << p;
		}
		std::cout << '\n';
	}

	bool check(const bool condition, const char* const what)
	{
		if (!condition)
		{
			std::cerr << "unexpected: " << what << std::endl;
		}
		return condition;
	}
} // anonymous namespace

int main()
{
	valord::valord_map<int, person> people;
	people.insert(1, { 18, "qians1" });
	people.insert(2, { 19, "qians2" });
	people.insert(3, { 20, "qians3" });
	people.insert(4, { 21, "qians4" });
	people.insert(5, { 22, "qians5" });

	bool ok = true;
	ok &= check(people.first().size() == 1 && people.first().begin()->first == 1, "youngest is 1");
	ok &= check(people.last().size() == 1 && people.last().begin()->first == 5, "oldest is 5");
	print("youngest", people.first());
	print("oldest", people.last());

	// Everyone has a birthday.
	for (auto handle : people.iter_mut())
	{
		handle->m_age += 1;
	}
	ok &= check(people.first().begin()->second.m_age == 19, "youngest is now 19");
	ok &= check(people.last().begin()->second.m_age == 23, "oldest is now 23");

	using bound = decltype(people)::bound_type;
	const auto seniors = people.range(bound::included(22), bound::unbounded());
	ok &= check(seniors.size() == 2, "two people aged 22 or more");
	print("range", seniors);

	std::cout << "range mut:";
	for (auto handle : people.range_mut(bound::included(22), bound::unbounded()))
	{
		auto [id, p] = handle.get_mut_with_key();
		p.m_age = 30;
		std::cout << " (" << id << ", " << p.m_name << ", " << p.m_age << ')';
	}
	std::cout << '\n';

	const auto oldest = people.last();
	ok &= check(oldest.size() == 2, "two oldest");
	ok &= check(oldest.begin()->first == 4 && std::next(oldest.begin())->first == 5, "oldest are 4 and 5");
	print("people", people.iter());

	return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
