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

#include <absl/time/time.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using valord::valord_map;

namespace
{
	class valord_watcher : public ::testing::Test
	{ };

	using map_type = valord_map<std::string, int>;

	// Take whatever is new right now without blocking.
	std::optional<int> poll(map_type::watcher_type& w)
	{
		const auto head = w.head_changed_for(absl::ZeroDuration());
		if (!head.has_value())
		{
			return std::nullopt;
		}
		return **head;
	}
} // anonymous namespace

TEST_F(valord_watcher, initial_state)
{
	map_type x;
	auto w = x.watch();
	EXPECT_EQ(w.borrow(), nullptr);
	EXPECT_FALSE(w.has_changed());
	EXPECT_FALSE(w.closed());
	EXPECT_FALSE(poll(w).has_value());
}
TEST_F(valord_watcher, publishes_new_maxima)
{
	map_type x;
	auto w = x.watch();

	x.insert("a", 1);
	EXPECT_TRUE(w.has_changed());
	EXPECT_EQ(poll(w), std::optional<int>(1));
	EXPECT_FALSE(w.has_changed());

	x.insert("b", 2);
	EXPECT_EQ(poll(w), std::optional<int>(2));

	x.insert("c", 1);
	EXPECT_FALSE(w.has_changed());
	EXPECT_FALSE(poll(w).has_value());

	x.insert("d", 3);
	EXPECT_EQ(poll(w), std::optional<int>(3));
	ASSERT_NE(w.borrow(), nullptr);
	EXPECT_EQ(*w.borrow(), 3);
}
TEST_F(valord_watcher, equal_maximum_not_published)
{
	map_type x;
	x.insert("a", 5);
	auto w = x.watch();
	x.insert("b", 5);
	EXPECT_FALSE(w.has_changed());
	x.insert("c", 6);
	EXPECT_EQ(poll(w), std::optional<int>(6));
}
TEST_F(valord_watcher, only_insert_publishes)
{
	map_type x{ { "a", 1 } };
	auto w = x.watch();
	x.modify("a", [](int& v) { v = 100; });
	x.entry("b").or_insert(200);
	EXPECT_FALSE(w.has_changed());

	// Compared against the order index, which now holds 200.
	x.insert("c", 150);
	EXPECT_FALSE(w.has_changed());
	x.insert("d", 201);
	EXPECT_EQ(poll(w), std::optional<int>(201));
}
TEST_F(valord_watcher, publishes_after_empty)
{
	map_type x;
	auto w = x.watch();
	x.insert("a", 10);
	x.remove("a");
	EXPECT_EQ(poll(w), std::optional<int>(10));
	x.insert("b", 1);
	EXPECT_EQ(poll(w), std::optional<int>(1));
}
TEST_F(valord_watcher, latest_value_wins)
{
	map_type x;
	auto slow = x.watch();
	for (int n = 1; n <= 10; ++n)
	{
		x.insert(std::to_string(n), n);
	}
	EXPECT_EQ(poll(slow), std::optional<int>(10));
	EXPECT_FALSE(poll(slow).has_value());

	// A later subscriber only sees what comes after it.
	auto late = x.watch();
	EXPECT_FALSE(late.has_changed());
	ASSERT_NE(late.borrow(), nullptr);
	EXPECT_EQ(*late.borrow(), 10);
}
TEST_F(valord_watcher, closed_with_container)
{
	std::optional<map_type::watcher_type> w;
	{
		map_type x;
		w.emplace(x.watch());
		x.insert("a", 1);
		EXPECT_FALSE(w->closed());
	}
	EXPECT_TRUE(w->closed());

	// The last published head is still delivered, then closure.
	const auto head = w->head_changed();
	ASSERT_TRUE(head.has_value());
	EXPECT_EQ(**head, 1);
	EXPECT_FALSE(w->head_changed().has_value());
}
TEST_F(valord_watcher, closed_on_move_assign)
{
	map_type x;
	auto w = x.watch();
	x = map_type{ { "b", 2 } };
	EXPECT_TRUE(w.closed());

	auto fresh = x.watch();
	x.insert("c", 3);
	EXPECT_EQ(poll(fresh), std::optional<int>(3));
}
TEST_F(valord_watcher, moved_from_watcher)
{
	map_type x;
	auto w = x.watch();
	x.insert("a", 1);

	auto v = std::move(w);
	EXPECT_TRUE(v.has_changed());
	EXPECT_EQ(poll(v), std::optional<int>(1));

	// The moved-from watcher acts as one whose container is gone.
	EXPECT_TRUE(w.closed());
	EXPECT_FALSE(w.has_changed());
	EXPECT_EQ(w.borrow(), nullptr);
	EXPECT_FALSE(w.head_changed().has_value());
	EXPECT_FALSE(poll(w).has_value());

	x.insert("b", 2);
	EXPECT_FALSE(w.has_changed());
	EXPECT_EQ(poll(v), std::optional<int>(2));
}
TEST_F(valord_watcher, head_changed_wakes_other_thread)
{
	map_type x;
	auto w = x.watch();

	std::vector<int> seen;
	std::thread subscriber([&w, &seen]()
		{
			while (const auto head = w.head_changed())
			{
				seen.push_back(**head);
				if (**head == 3)
				{
					break;
				}
			}
		});

	x.insert("a", 1);
	x.insert("b", 2);
	x.insert("c", 1);
	x.insert("d", 3);
	subscriber.join();

	// Intermediate maxima may be skipped, but they arrive in order and end on the last one.
	ASSERT_FALSE(seen.empty());
	EXPECT_EQ(seen.back(), 3);
	EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
}
TEST_F(valord_watcher, head_changed_for_times_out)
{
	map_type x{ { "a", 1 } };
	auto w = x.watch();
	const absl::Time start = absl::Now();
	EXPECT_FALSE(w.head_changed_for(absl::Milliseconds(20)).has_value());
	EXPECT_GE(absl::Now() - start, absl::Milliseconds(10));
}
