// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpBridge/Source/base/chunk_tuner.h"

using namespace fbr;


class ChunkTunerTest : public ::testing::Test
{
protected:
    size_t tune(std::optional<uint64_t> fileSize) const { return tuneChunkSize(fileSize, defaultSize_, minSize_, maxSize_); }

    const size_t defaultSize_ = 8192;
    const size_t minSize_ = 1024;
    const size_t maxSize_ = 1024 * 1024;
};


TEST_F(ChunkTunerTest, SmallOrUnknownKeepsDefault)
{
    EXPECT_EQ(tune(std::nullopt), defaultSize_);
    EXPECT_EQ(tune(0), defaultSize_);
    EXPECT_EQ(tune(2048000), defaultSize_);
    EXPECT_EQ(tune(CHUNK_TUNE_THRESHOLD_DEFAULT), defaultSize_);
}


TEST_F(ChunkTunerTest, GrowsWithFileSize)
{
    EXPECT_EQ(tune(CHUNK_TUNE_THRESHOLD_DEFAULT + 1), defaultSize_ * 8);
    EXPECT_EQ(tune(CHUNK_TUNE_THRESHOLD_DEFAULT * 2), defaultSize_ * 16);
    EXPECT_EQ(tune(CHUNK_TUNE_THRESHOLD_DEFAULT * 3), defaultSize_ * 16);
    EXPECT_EQ(tune(CHUNK_TUNE_THRESHOLD_DEFAULT * 4), defaultSize_ * 32);
}


TEST_F(ChunkTunerTest, Monotonic)
{
    size_t prev = 0;
    for (uint64_t size = 1; size < (uint64_t(1) << 40); size *= 3)
    {
        const size_t chunkSize = tune(size);
        EXPECT_GE(chunkSize, prev);
        prev = chunkSize;
    }
}


TEST_F(ChunkTunerTest, ClampedToBounds)
{
    EXPECT_EQ(tune(uint64_t(1) << 40), maxSize_);
    EXPECT_EQ(tune(UINT64_MAX), maxSize_); //no overflow

    EXPECT_EQ(tuneChunkSize(std::nullopt, 100, 1024, 4096), 1024u);
    EXPECT_EQ(tuneChunkSize(std::nullopt, 100000, 1024, 4096), 4096u);
}


TEST_F(ChunkTunerTest, CustomThreshold)
{
    EXPECT_EQ(tuneChunkSize(1000, 1024, 1024, 1024 * 1024, 500), 1024u * 16);
}
