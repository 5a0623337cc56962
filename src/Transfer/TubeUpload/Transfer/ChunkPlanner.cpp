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

#include "ChunkPlanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace TubeUpload::Transfer {

std::uint64_t ChunkPlanner::normalizeChunkSize(std::uint64_t requested) noexcept
{
	if (requested == 0) {
		return kDefaultChunkSize;
	}
	const std::uint64_t clamped = std::clamp(requested, kMinChunkSize, kMaxChunkSize);
	return clamped - clamped % kChunkGranularity;
}

ChunkPlanner::ChunkPlanner(std::uint64_t totalSize, std::uint64_t chunkSize)
	: totalSize_(totalSize),
	  chunkSize_(chunkSize > 0 ? chunkSize : throw std::invalid_argument("ChunkSizeIsZeroError(ChunkPlanner)"))
{
}

std::optional<ChunkRange> ChunkPlanner::nextRange() const noexcept
{
	if (offset_ >= totalSize_) {
		return std::nullopt;
	}
	return ChunkRange{offset_, std::min(chunkSize_, totalSize_ - offset_)};
}

std::vector<ChunkRange> ChunkPlanner::plan() const
{
	std::vector<ChunkRange> ranges;
	for (std::uint64_t offset = offset_; offset < totalSize_; offset += chunkSize_) {
		ranges.push_back(ChunkRange{offset, std::min(chunkSize_, totalSize_ - offset)});
	}
	return ranges;
}

bool ChunkPlanner::advance(std::uint64_t acknowledgedOffset)
{
	if (acknowledgedOffset > totalSize_) {
		throw std::out_of_range("OffsetBeyondTotalSizeError(ChunkPlanner):" + std::to_string(acknowledgedOffset));
	}
	if (acknowledgedOffset <= offset_) {
		return false;
	}
	offset_ = acknowledgedOffset;
	return true;
}

} // namespace TubeUpload::Transfer
