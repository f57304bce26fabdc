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

#include <gtest/gtest.h>

#include <valord/valord_map.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using valord::borrow_error;
using valord::valord_map;

namespace
{
	class valord_entry : public ::testing::Test
	{ };

	using map_type = valord_map<std::string, int>;

	std::vector<std::pair<std::string, int>> collect(const map_type& x)
	{
		return { x.begin(), x.end() };
	}
} // anonymous namespace

TEST_F(valord_entry, or_insert_vacant)
{
	map_type x{ { "a", 5 } };
	{
		auto e = x.entry("b");
		EXPECT_TRUE(e.is_vacant());
		EXPECT_EQ(e.key(), "b");
		int& value = e.or_insert(1);
		EXPECT_EQ(value, 1);
		EXPECT_TRUE(e.is_occupied());
		EXPECT_EQ(e.key(), "b");
	}
	EXPECT_EQ(x.size(), 2u);
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 1 }, { "a", 5 } }));
}
TEST_F(valord_entry, or_insert_occupied_keeps_value)
{
	map_type x{ { "a", 5 } };
	{
		auto e = x.entry("a");
		EXPECT_TRUE(e.is_occupied());
		EXPECT_EQ(e.or_insert(1), 5);
		EXPECT_EQ(e.or_insert_with([]() -> int
			{
				ADD_FAILURE() << "make called on an occupied entry";
				return 0;
			}), 5);
	}
	EXPECT_EQ(x.size(), 1u);
	EXPECT_EQ(x.at("a"), 5);
}
TEST_F(valord_entry, or_insert_variants)
{
	map_type x;
	EXPECT_EQ(x.entry("a").or_insert_with([]() { return 7; }), 7);
	EXPECT_EQ(x.entry("bb").or_insert_with_key([](const std::string& key) { return static_cast<int>(key.size()); }), 2);
	EXPECT_EQ(x.entry("c").or_default(), 0);
	EXPECT_EQ(x.size(), 3u);
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "c", 0 }, { "bb", 2 }, { "a", 7 } }));
}
TEST_F(valord_entry, commit_on_release)
{
	map_type x{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
	{
		auto e = x.entry("a");
		e.or_insert(0) = 10;

		// Detached while the entry is open.
		EXPECT_EQ(x.bucket_count(), 2u);
		EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 2 }, { "c", 3 } }));
	}
	EXPECT_EQ(x.bucket_count(), 3u);
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 2 }, { "c", 3 }, { "a", 10 } }));
}
TEST_F(valord_entry, explicit_release)
{
	map_type x{ { "a", 1 } };
	auto e = x.entry("a");
	e.or_insert(0) = 4;
	e.release();
	e.release();
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "a", 4 } }));
	x.insert("b", 2);
	EXPECT_EQ(x.size(), 2u);
}
TEST_F(valord_entry, and_modify)
{
	map_type x{ { "a", 1 } };
	EXPECT_EQ(x.entry("a").and_modify([](int& v) { v += 10; }).or_insert(0), 11);
	EXPECT_EQ(x.entry("b").and_modify([](int& v) { v += 10; }).or_insert(0), 0);
	EXPECT_EQ(x.at("a"), 11);
	EXPECT_EQ(x.at("b"), 0);

	auto e = x.entry("a");
	e.and_modify([](int& v) { v *= 2; }).and_modify([](int& v) { v += 1; });
	EXPECT_EQ(e.handle().value(), 23);
}
TEST_F(valord_entry, vacant_reservation_reused)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	x.remove("a");
	ASSERT_EQ(x.slots().free_count(), 1u);

	for (int n = 0; n < 3; ++n)
	{
		auto e = x.entry("z");
		EXPECT_TRUE(e.is_vacant());
		EXPECT_EQ(e.handle().index(), 0u);
	}
	EXPECT_EQ(x.slots().slot_count(), 2u);
	EXPECT_EQ(x.size(), 1u);

	// Without a free slot the reservation appends exactly one slot.
	x.entry("z").or_insert(26);
	for (int n = 0; n < 3; ++n)
	{
		auto e = x.entry("y");
		EXPECT_EQ(e.handle().index(), 2u);
		EXPECT_FALSE(e.handle().occupied());
	}
	EXPECT_EQ(x.slots().slot_count(), 3u);
	EXPECT_EQ(x.size(), 2u);
	EXPECT_TRUE(x.iter().size() == 2u);

	x.insert("w", 0);
	EXPECT_EQ(x.get_by_index(2)->first, "w");
}
TEST_F(valord_entry, get_mut)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	EXPECT_FALSE(x.get_mut("z").has_value());
	{
		auto handle = x.get_mut("a");
		ASSERT_TRUE(handle.has_value());
		EXPECT_TRUE(handle->occupied());
		EXPECT_EQ(handle->key(), "a");
		**handle = 3;
		EXPECT_EQ(x.get("a"), &handle->value());
	}
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 2 }, { "a", 3 } }));
}
TEST_F(valord_entry, modify)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	EXPECT_TRUE(x.modify("a", [](int& v) { v = 5; }));
	EXPECT_TRUE(x.modify("b", [](const std::string& key, int& v) { v = static_cast<int>(key.size()) + 10; }));
	EXPECT_FALSE(x.modify("z", [](int&) { ADD_FAILURE() << "modify called for a missing key"; }));
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "a", 5 }, { "b", 11 } }));
}
TEST_F(valord_entry, modify_throwing_still_reattaches)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	EXPECT_THROW(x.modify("a", [](int& v)
		{
			v = 3;
			throw std::runtime_error("modify");
		}), std::runtime_error);
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 2 }, { "a", 3 } }));
	x.insert("c", 0);
	EXPECT_EQ(x.size(), 3u);
}
TEST_F(valord_entry, handle_move)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	{
		auto first = x.get_mut("a");
		ASSERT_TRUE(first.has_value());
		auto second = std::move(*first);
		EXPECT_FALSE(first->is_open());
		*second = 9;
		first.reset();

		// Still open through the moved-to handle.
		EXPECT_THROW(x.insert("c", 3), borrow_error);
	}
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "b", 2 }, { "a", 9 } }));
}
TEST_F(valord_entry, borrow_rejects_mutation)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	{
		auto handle = x.get_mut("a");
		EXPECT_THROW(x.insert("c", 3), borrow_error);
		EXPECT_THROW(x.remove("b"), borrow_error);
		EXPECT_THROW(x.remove_entry("b"), borrow_error);
		EXPECT_THROW(x.get_mut("b"), borrow_error);
		EXPECT_THROW(x.get_mut("a"), borrow_error);
		EXPECT_THROW(x.entry("b"), borrow_error);
		EXPECT_THROW(x.entry("z"), borrow_error);
		EXPECT_THROW(x.modify("b", [](int&) { }), borrow_error);
		EXPECT_THROW(x.iter_mut(), borrow_error);
		EXPECT_THROW(x.re_order(), borrow_error);
		EXPECT_THROW(x.clear(), borrow_error);

		// Reads still work; the open slot is missing from ordered views.
		EXPECT_EQ(x.at("a"), 1);
		EXPECT_EQ(x.iter().size(), 1u);
	}
	EXPECT_EQ(x.size(), 2u);
	EXPECT_EQ(x.slots().slot_count(), 2u);
	EXPECT_EQ(collect(x), (std::vector<std::pair<std::string, int>>{ { "a", 1 }, { "b", 2 } }));
}
TEST_F(valord_entry, borrow_error_names_operation)
{
	map_type x{ { "a", 1 } };
	auto handle = x.get_mut("a");
	try
	{
		x.insert("b", 2);
		FAIL() << "insert succeeded with an open handle";
	}
	catch (const borrow_error& e)
	{
		EXPECT_NE(std::string(e.what()).find("valord_map::insert"), std::string::npos);
	}
}
TEST_F(valord_entry, sequence_rejects_mutation)
{
	map_type x{ { "a", 1 }, { "b", 2 } };
	{
		auto sequence = x.iter_mut();
		EXPECT_THROW(x.insert("c", 3), borrow_error);
		EXPECT_THROW(x.get_mut("a"), borrow_error);
		EXPECT_THROW(x.rev_iter_mut(), borrow_error);

		auto first = sequence.next();
		ASSERT_TRUE(first.has_value());
		EXPECT_EQ(first->key(), "a");

		// The previous handle is still open.
		EXPECT_THROW(sequence.next(), borrow_error);
		first.reset();

		auto second = sequence.next();
		ASSERT_TRUE(second.has_value());
		EXPECT_EQ(second->key(), "b");
		second.reset();
		EXPECT_FALSE(sequence.next().has_value());

		// Exhausted, but still alive.
		EXPECT_THROW(x.remove("a"), borrow_error);
	}
	x.insert("c", 3);
	EXPECT_EQ(x.size(), 3u);
}
