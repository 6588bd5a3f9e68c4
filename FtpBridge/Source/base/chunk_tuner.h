// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CHUNK_TUNER_H_0923847510293847561
#define CHUNK_TUNER_H_0923847510293847561

#include <cstdint>
#include <cstddef>
#include <optional>


namespace fbr
{
const uint64_t CHUNK_TUNE_THRESHOLD_DEFAULT = 10 * 1024 * 1024;

/*  fewer round trips for big files:
    - fileSize unknown or <= threshold: configured default
    - otherwise: default * 8 * 2^floor(log2(fileSize / threshold))
    - result is always clamped to [minSize, maxSize]

    deterministic, no side effects; CONTRACT: minSize <= maxSize     */
size_t tuneChunkSize(std::optional<uint64_t> fileSize, size_t defaultSize, size_t minSize, size_t maxSize,
                     uint64_t tuneThreshold = CHUNK_TUNE_THRESHOLD_DEFAULT);
}

#endif //CHUNK_TUNER_H_0923847510293847561
