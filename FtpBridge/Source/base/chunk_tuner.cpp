// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "chunk_tuner.h"
#include <algorithm>
#include <bit>


size_t fbr::tuneChunkSize(std::optional<uint64_t> fileSize, size_t defaultSize, size_t minSize, size_t maxSize, uint64_t tuneThreshold)
{
    auto clampToBounds = [&](uint64_t chunkSize) { return static_cast<size_t>(std::clamp<uint64_t>(chunkSize, minSize, std::max(minSize, maxSize))); };

    if (!fileSize || tuneThreshold == 0 || *fileSize <= tuneThreshold)
        return clampToBounds(defaultSize);

    const uint64_t ratio = *fileSize / tuneThreshold; //>= 1
    const int exponent = static_cast<int>(std::bit_width(ratio)) - 1; //floor(log2(ratio))

    uint64_t chunkSize = static_cast<uint64_t>(defaultSize) * 8;
    for (int i = 0; i < exponent && chunkSize < maxSize; ++i) //saturate before overflow
        chunkSize *= 2;

    return clampToBounds(chunkSize);
}
