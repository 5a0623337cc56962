/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * TubeUpload Transfer Library
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

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace TubeUpload::Transfer {

struct ChunkRange {
	std::uint64_t offset = 0;
	std::uint64_t length = 0;

	[[nodiscard]]
	std::uint64_t end() const noexcept
	{
		return offset + length;
	}

	bool operator==(const ChunkRange &) const = default;
};

/**
 * Splits [0, totalSize) into contiguous ranges of at most chunkSize bytes, starting from the
 * offset the server has confirmed. The cursor only moves forward.
 */
class ChunkPlanner {
public:
	static constexpr std::uint64_t kChunkGranularity = 256 * 1024;
	static constexpr std::uint64_t kMinChunkSize = kChunkGranularity;
	static constexpr std::uint64_t kMaxChunkSize = 1024ULL * 1024 * 1024;
	static constexpr std::uint64_t kDefaultChunkSize = 8 * 1024 * 1024;

	/// Clamps to [kMinChunkSize, kMaxChunkSize] and rounds down to kChunkGranularity. 0 selects the default.
	[[nodiscard]]
	static std::uint64_t normalizeChunkSize(std::uint64_t requested) noexcept;

	ChunkPlanner(std::uint64_t totalSize, std::uint64_t chunkSize);

	[[nodiscard]]
	std::optional<ChunkRange> nextRange() const noexcept;

	/// Every remaining range in ascending order. Calling it again yields the same sequence until advance().
	[[nodiscard]]
	std::vector<ChunkRange> plan() const;

	/// Moves the cursor to `acknowledgedOffset`. Returns false when that is not forward progress.
	/// Throws std::out_of_range past totalSize.
	bool advance(std::uint64_t acknowledgedOffset);

	[[nodiscard]]
	std::uint64_t currentOffset() const noexcept
	{
		return offset_;
	}

	[[nodiscard]]
	std::uint64_t totalSize() const noexcept
	{
		return totalSize_;
	}

	[[nodiscard]]
	std::uint64_t chunkSize() const noexcept
	{
		return chunkSize_;
	}

	[[nodiscard]]
	bool isComplete() const noexcept
	{
		return offset_ == totalSize_;
	}

private:
	const std::uint64_t totalSize_;
	const std::uint64_t chunkSize_;
	std::uint64_t offset_ = 0;
};

} // namespace TubeUpload::Transfer
