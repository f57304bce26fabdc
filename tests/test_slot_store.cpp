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

#include <valord/slot_store.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using valord::slot_store;

namespace
{
	class valord_slot_store : public ::testing::Test
	{ };

	using store_type = slot_store<std::string, int>;

	std::vector<std::size_t> free_indices(const store_type& store)
	{
		return { store.free_list().begin(), store.free_list().end() };
	}

	// A value whose move construction throws once m_moves_left reaches zero.
	struct fragile
	{
		int m_value;
		int m_moves_left;

		fragile(const int value, const int moves_left)
			: m_value{ value }
			, m_moves_left{ moves_left }
		{ }
		fragile(const fragile&) = default;
		fragile(fragile&& other)
			: m_value{ other.m_value }
			, m_moves_left{ other.m_moves_left - 1 }
		{
			if (other.m_moves_left == 0)
			{
				throw std::runtime_error("fragile move");
			}
		}
		fragile& operator=(const fragile&) = default;
		fragile& operator=(fragile&&) = default;
	};
} // anonymous namespace

TEST_F(valord_slot_store, empty)
{
	store_type x;
	EXPECT_TRUE(x.empty());
	EXPECT_EQ(x.size(), 0u);
	EXPECT_EQ(x.slot_count(), 0u);
	EXPECT_EQ(x.free_count(), 0u);
	EXPECT_EQ(x.find("a"), store_type::npos);
	EXPECT_EQ(x.get("a"), nullptr);
	EXPECT_EQ(x.get_by_index(0), nullptr);
	EXPECT_FALSE(x.take("a").has_value());
	EXPECT_FALSE(x.take_by_index(0).has_value());
}
TEST_F(valord_slot_store, allocate_appends)
{
	store_type x;
	EXPECT_EQ(x.allocate_or_reuse("a", 1), 0u);
	EXPECT_EQ(x.allocate_or_reuse("b", 2), 1u);
	EXPECT_EQ(x.allocate_or_reuse("c", 3), 2u);
	EXPECT_EQ(x.size(), 3u);
	EXPECT_EQ(x.slot_count(), 3u);
	EXPECT_EQ(x.find("b"), 1u);
	ASSERT_NE(x.get("c"), nullptr);
	EXPECT_EQ(*x.get("c"), 3);
	ASSERT_NE(x.get_by_index(0), nullptr);
	EXPECT_EQ(x.get_by_index(0)->first, "a");
	EXPECT_EQ(x.get_by_index(0)->second, 1);
	EXPECT_EQ(x.get_by_index(3), nullptr);
}
TEST_F(valord_slot_store, allocate_existing_in_place)
{
	store_type x;
	x.allocate_or_reuse("a", 1);
	x.allocate_or_reuse("b", 2);
	EXPECT_EQ(x.next_index(), 2u);

	EXPECT_EQ(x.allocate_or_reuse("b", 20), 1u);
	EXPECT_EQ(*x.get("b"), 20);
	EXPECT_EQ(x.size(), 2u);
	EXPECT_EQ(x.slot_count(), 2u);
	EXPECT_EQ(x.next_index(), 2u);

	x.take("a");
	EXPECT_EQ(x.next_index(), 0u);
}
TEST_F(valord_slot_store, allocate_throwing_changes_nothing)
{
	slot_store<std::string, fragile> x;
	x.allocate_or_reuse("a", fragile{ 1, -1 });
	x.allocate_or_reuse("b", fragile{ 2, -1 });
	x.take("a");

	// Recycled slot: the free list keeps its front.
	for (int moves = 0; moves < 3; ++moves)
	{
		EXPECT_THROW(x.allocate_or_reuse("c", fragile{ 3, moves }), std::runtime_error);
		EXPECT_FALSE(x.contains("c"));
		EXPECT_EQ(x.get_by_index(0), nullptr);
		EXPECT_EQ(x.size(), 1u);
		EXPECT_EQ(x.slot_count(), 2u);
		EXPECT_EQ(x.free_count(), 1u);
	}

	// Appended slot: the slot is dropped again.
	x.allocate_or_reuse("d", fragile{ 4, -1 });
	for (int moves = 0; moves < 3; ++moves)
	{
		EXPECT_THROW(x.allocate_or_reuse("c", fragile{ 3, moves }), std::runtime_error);
		EXPECT_FALSE(x.contains("c"));
		EXPECT_EQ(x.size(), 2u);
		EXPECT_EQ(x.slot_count(), 2u);
		EXPECT_EQ(x.free_count(), 0u);
	}
}
TEST_F(valord_slot_store, fill_vacant_throwing_keeps_reservation)
{
	slot_store<std::string, fragile> x;
	x.allocate_or_reuse("a", fragile{ 1, -1 });
	const std::size_t vacant = x.reserve_vacant();

	for (int moves = 0; moves < 2; ++moves)
	{
		EXPECT_THROW(x.fill_vacant(vacant, "b", fragile{ 2, moves }), std::runtime_error);
		EXPECT_FALSE(x.contains("b"));
		EXPECT_EQ(x.reserve_vacant(), vacant);
		EXPECT_EQ(x.size(), 1u);
	}
	x.fill_vacant(vacant, "b", fragile{ 2, -1 });
	EXPECT_EQ(x.find("b"), vacant);
	EXPECT_EQ(x.size(), 2u);
}
TEST_F(valord_slot_store, take_tombstones)
{
	store_type x;
	x.allocate_or_reuse("a", 1);
	x.allocate_or_reuse("b", 2);

	const auto taken = x.take("a");
	ASSERT_TRUE(taken.has_value());
	EXPECT_EQ(taken->first, "a");
	EXPECT_EQ(taken->second, 1);
	EXPECT_FALSE(x.contains("a"));
	EXPECT_EQ(x.get_by_index(0), nullptr);
	EXPECT_EQ(x.size(), 1u);
	EXPECT_EQ(x.slot_count(), 2u);
	EXPECT_EQ(free_indices(x), std::vector<std::size_t>({ 0 }));

	const auto by_index = x.take_by_index(1);
	ASSERT_TRUE(by_index.has_value());
	EXPECT_EQ(by_index->first, "b");
	EXPECT_FALSE(x.take_by_index(1).has_value());
	EXPECT_TRUE(x.empty());
	EXPECT_EQ(free_indices(x), std::vector<std::size_t>({ 0, 1 }));
}
TEST_F(valord_slot_store, recycle_fifo)
{
	store_type x;
	for (int i = 0; i < 5; ++i)
	{
		x.allocate_or_reuse(std::to_string(i), i);
	}
	x.take("3");
	x.take("1");
	x.take("4");
	EXPECT_EQ(free_indices(x), std::vector<std::size_t>({ 3, 1, 4 }));

	// Oldest tombstone first.
	EXPECT_EQ(x.allocate_or_reuse("x", 10), 3u);
	EXPECT_EQ(x.allocate_or_reuse("y", 11), 1u);
	EXPECT_EQ(x.allocate_or_reuse("z", 12), 4u);
	EXPECT_EQ(x.allocate_or_reuse("w", 13), 5u);
	EXPECT_EQ(x.free_count(), 0u);
	EXPECT_EQ(x.size(), 6u);
	EXPECT_EQ(x.slot_count(), 6u);
}
TEST_F(valord_slot_store, reserve_vacant_idempotent)
{
	store_type x;
	x.allocate_or_reuse("a", 1);

	const std::size_t reserved = x.reserve_vacant();
	EXPECT_EQ(reserved, 1u);
	EXPECT_EQ(x.reserve_vacant(), reserved);
	EXPECT_EQ(x.reserve_vacant(), reserved);
	EXPECT_EQ(x.slot_count(), 2u);
	EXPECT_EQ(x.free_count(), 1u);
	EXPECT_EQ(x.size(), 1u);
	EXPECT_EQ(x.get_by_index(reserved), nullptr);

	x.fill_vacant(reserved, "b", 2);
	EXPECT_EQ(x.size(), 2u);
	EXPECT_EQ(x.free_count(), 0u);
	EXPECT_EQ(x.find("b"), reserved);
	EXPECT_EQ(*x.get("b"), 2);
}
TEST_F(valord_slot_store, reserve_vacant_prefers_free_front)
{
	store_type x;
	x.allocate_or_reuse("a", 1);
	x.allocate_or_reuse("b", 2);
	x.allocate_or_reuse("c", 3);
	x.take("b");
	x.take("a");

	EXPECT_EQ(x.reserve_vacant(), 1u);
	EXPECT_EQ(x.slot_count(), 3u);
	x.fill_vacant(1, "d", 4);
	EXPECT_EQ(free_indices(x), std::vector<std::size_t>({ 0 }));

	// An unfilled reservation is the next slot a plain allocation reuses.
	EXPECT_EQ(x.reserve_vacant(), 0u);
	EXPECT_EQ(x.allocate_or_reuse("e", 5), 0u);
}
TEST_F(valord_slot_store, for_each_occupied)
{
	store_type x;
	x.allocate_or_reuse("a", 1);
	x.allocate_or_reuse("b", 2);
	x.allocate_or_reuse("c", 3);
	x.take("b");

	std::vector<std::pair<std::size_t, std::string>> seen;
	x.for_each_occupied([&seen](const std::size_t index, const std::pair<std::string, int>& kv)
		{
			seen.emplace_back(index, kv.first);
		});
	ASSERT_EQ(seen.size(), 2u);
	EXPECT_EQ(seen[0], std::make_pair(std::size_t{ 0 }, std::string("a")));
	EXPECT_EQ(seen[1], std::make_pair(std::size_t{ 2 }, std::string("c")));
}
TEST_F(valord_slot_store, get_mutable)
{
	store_type x;
	x.allocate_or_reuse("a", 1);
	*x.get("a") = 7;
	EXPECT_EQ(x.get_by_index(0)->second, 7);
	x.get_by_index(0)->second = 8;
	EXPECT_EQ(*std::as_const(x).get("a"), 8);
}
TEST_F(valord_slot_store, clear_reserve)
{
	store_type x;
	x.reserve(16);
	x.allocate_or_reuse("a", 1);
	x.allocate_or_reuse("b", 2);
	x.take("a");
	x.clear();
	EXPECT_TRUE(x.empty());
	EXPECT_EQ(x.slot_count(), 0u);
	EXPECT_EQ(x.free_count(), 0u);
	EXPECT_FALSE(x.contains("b"));
	EXPECT_EQ(x.allocate_or_reuse("c", 3), 0u);
}
TEST_F(valord_slot_store, swap)
{
	store_type x;
	store_type y;
	x.allocate_or_reuse("a", 1);
	y.allocate_or_reuse("b", 2);
	y.allocate_or_reuse("c", 3);
	x.swap(y);
	EXPECT_EQ(x.size(), 2u);
	EXPECT_EQ(y.size(), 1u);
	EXPECT_TRUE(x.contains("c"));
	EXPECT_TRUE(y.contains("a"));
}
