/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Transfer Tests
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include <TubeUpload/Transfer/ChunkPlanner.hpp>

using TubeUpload::Transfer::ChunkPlanner;
using TubeUpload::Transfer::ChunkRange;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

} // anonymous namespace

TEST(ChunkPlannerTest, CoversFileExactlyOnceInOrder)
{
	const std::initializer_list<std::uint64_t> totals{1, 5 * kMiB - 1, 5 * kMiB, 5 * kMiB + 1, 23 * kMiB + 17};
	for (const std::uint64_t total : totals) {
		const ChunkPlanner planner(total, 5 * kMiB);
		const auto ranges = planner.plan();

		std::uint64_t expectedOffset = 0;
		for (const ChunkRange &range : ranges) {
			EXPECT_EQ(range.offset, expectedOffset);
			EXPECT_GT(range.length, 0u);
			EXPECT_LE(range.length, 5 * kMiB);
			expectedOffset = range.end();
		}
		EXPECT_EQ(expectedOffset, total);

		const std::uint64_t remainder = total % (5 * kMiB);
		EXPECT_EQ(ranges.back().length, remainder == 0 ? 5 * kMiB : remainder);
	}
}

TEST(ChunkPlannerTest, EmptyFileHasNoRanges)
{
	ChunkPlanner planner(0, 5 * kMiB);
	EXPECT_TRUE(planner.plan().empty());
	EXPECT_FALSE(planner.nextRange().has_value());
	EXPECT_TRUE(planner.isComplete());
}

TEST(ChunkPlannerTest, AdvanceMovesOnlyForward)
{
	ChunkPlanner planner(12 * kMiB, 5 * kMiB);

	EXPECT_EQ(planner.nextRange(), (ChunkRange{0, 5 * kMiB}));
	EXPECT_TRUE(planner.advance(3 * kMiB));
	EXPECT_EQ(planner.nextRange(), (ChunkRange{3 * kMiB, 5 * kMiB}));

	EXPECT_FALSE(planner.advance(3 * kMiB));
	EXPECT_FALSE(planner.advance(1 * kMiB));
	EXPECT_EQ(planner.currentOffset(), 3 * kMiB);

	EXPECT_TRUE(planner.advance(12 * kMiB));
	EXPECT_TRUE(planner.isComplete());
	EXPECT_FALSE(planner.nextRange().has_value());
}

TEST(ChunkPlannerTest, PlanIsStableUntilAdvance)
{
	ChunkPlanner planner(11 * kMiB, 4 * kMiB);
	EXPECT_EQ(planner.plan(), planner.plan());
	EXPECT_EQ(planner.plan().size(), 3u);

	planner.advance(8 * kMiB);
	EXPECT_EQ(planner.plan(), (std::vector<ChunkRange>{{8 * kMiB, 3 * kMiB}}));
}

TEST(ChunkPlannerTest, AdvancePastEndThrows)
{
	ChunkPlanner planner(kMiB, kMiB);
	EXPECT_THROW(planner.advance(kMiB + 1), std::out_of_range);
}

TEST(ChunkPlannerTest, ZeroChunkSizeIsRejected)
{
	EXPECT_THROW(ChunkPlanner(kMiB, 0), std::invalid_argument);
}

TEST(ChunkPlannerTest, NormalizeChunkSize)
{
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(0), ChunkPlanner::kDefaultChunkSize);
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(1), ChunkPlanner::kMinChunkSize);
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(5 * kMiB), 5 * kMiB);
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(5 * kMiB + 1000), 5 * kMiB);
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(4096ULL * kMiB), ChunkPlanner::kMaxChunkSize);
	EXPECT_EQ(ChunkPlanner::normalizeChunkSize(ChunkPlanner::kMaxChunkSize + 1), ChunkPlanner::kMaxChunkSize);
}
