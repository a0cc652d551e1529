#include <gtest/gtest.h>
#include "gridchunk/raster_chunk.hpp"

class RasterChunkTest : public ::testing::Test {
protected:
    gridchunk::RasterChunk chunk;

    void SetUp() override {
        chunk.rows = 2;
        chunk.cols = 3;
        chunk.buffer = 1;
        chunk.bands = 2;
        chunk.x_start = 4;
        chunk.y_start = 6;
        chunk.geotransform = {1000.0, 10.0, 0.0, 2000.0, 0.0, -10.0};
        chunk.nodata = -1.0;
        chunk.data.assign(2 * 4 * 5, -1.0);

        double v = 0;
        for (int b = 0; b < 2; b++) {
            for (int r = 1; r <= 2; r++) {
                for (int c = 1; c <= 3; c++) chunk.at(b, r, c) = v++;
            }
        }
    }
};

TEST_F(RasterChunkTest, PaddedShape) {
    EXPECT_EQ(chunk.padded_rows(), 4);
    EXPECT_EQ(chunk.padded_cols(), 5);
    EXPECT_EQ(chunk.band_stride(), 20u);
    EXPECT_EQ(chunk.band_data(1), chunk.data.data() + 20);
}

TEST_F(RasterChunkTest, CoreDropsBuffer) {
    std::vector<double> band0 = {0, 1, 2, 3, 4, 5};
    std::vector<double> band1 = {6, 7, 8, 9, 10, 11};

    EXPECT_EQ(chunk.core(0), band0);
    EXPECT_EQ(chunk.core(1), band1);
}

TEST_F(RasterChunkTest, CoreRejectsBadBand) {
    EXPECT_THROW(chunk.core(2), std::out_of_range);
    EXPECT_THROW(chunk.core(-1), std::out_of_range);
}

TEST_F(RasterChunkTest, CoreGeotransform) {
    auto gt = chunk.core_geotransform();

    EXPECT_DOUBLE_EQ(gt[0], 1040.0);
    EXPECT_DOUBLE_EQ(gt[3], 1940.0);
    EXPECT_DOUBLE_EQ(gt[1], 10.0);
    EXPECT_DOUBLE_EQ(gt[5], -10.0);
}

TEST_F(RasterChunkTest, FillValue) {
    EXPECT_DOUBLE_EQ(chunk.fill_value(), -1.0);

    chunk.nodata.reset();
    EXPECT_DOUBLE_EQ(chunk.fill_value(), 0.0);

    // Zero is a valid nodata, distinct from having none
    chunk.nodata = 0.0;
    EXPECT_TRUE(chunk.nodata.has_value());
}
