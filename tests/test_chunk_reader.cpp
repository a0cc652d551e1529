#include <gtest/gtest.h>
#include "gridchunk/chunk_reader.hpp"
#include "gridchunk/errors.hpp"
#include "fake_backend.hpp"

class ChunkReaderTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();

    void SetUp() override {
        FakeRaster dem = FakeRaster::make(20, 15, 2);
        dem.nodata = -9999.0;
        backend->files["dem.tif"] = dem;

        FakeRaster plain = FakeRaster::make(10, 10, 1);
        backend->files["plain.tif"] = plain;

        FakeRaster grid = FakeRaster::make(10, 10, 1);
        grid.nodata = -9999.0;
        backend->files["grid.tif"] = grid;
    }

    const FakeRaster& dem() const { return backend->files.at("dem.tif"); }
};

TEST_F(ChunkReaderTest, CapturesMetadata) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("dem.tif", 2, 3, 4, 5, 1);

    EXPECT_EQ(chunk.rows, 5);
    EXPECT_EQ(chunk.cols, 4);
    EXPECT_EQ(chunk.buffer, 1);
    EXPECT_EQ(chunk.bands, 2);
    EXPECT_EQ(chunk.data_type, "float32");
    EXPECT_EQ(chunk.projection, "EPSG:32636");
    EXPECT_EQ(chunk.driver_id, "GTiff");
    EXPECT_DOUBLE_EQ(chunk.cell_size, 2.0);
    EXPECT_DOUBLE_EQ(chunk.geotransform[0], 100.0);
    ASSERT_TRUE(chunk.nodata.has_value());
    EXPECT_DOUBLE_EQ(*chunk.nodata, -9999.0);
}

TEST_F(ChunkReaderTest, WholeFileByDefault) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("dem.tif");

    EXPECT_EQ(chunk.rows, 15);
    EXPECT_EQ(chunk.cols, 20);
    ASSERT_EQ(chunk.data.size(), 2u * 15 * 20);
    EXPECT_DOUBLE_EQ(chunk.at(0, 0, 0), dem().value(0, 0, 0));
    EXPECT_DOUBLE_EQ(chunk.at(1, 14, 19), dem().value(1, 14, 19));
}

TEST_F(ChunkReaderTest, UnbufferedWindowMatchesSource) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("dem.tif", 5, 4, 6, 3, 0);

    ASSERT_EQ(chunk.padded_rows(), 3);
    ASSERT_EQ(chunk.padded_cols(), 6);
    for (int b = 0; b < 2; b++) {
        for (int r = 0; r < 3; r++) {
            for (int c = 0; c < 6; c++) {
                EXPECT_DOUBLE_EQ(chunk.at(b, r, c), dem().value(b, r + 4, c + 5));
            }
        }
    }
}

TEST_F(ChunkReaderTest, InteriorBufferReadsNeighbours) {
    gridchunk::ChunkReader reader(backend);
    auto core = reader.read("dem.tif", 6, 5, 4, 4, 0);
    auto buffered = reader.read("dem.tif", 6, 5, 4, 4, 2);

    ASSERT_EQ(buffered.padded_rows(), 8);
    ASSERT_EQ(buffered.padded_cols(), 8);

    // Centre equals the unbuffered read
    for (int r = 0; r < 4; r++) {
        for (int c = 0; c < 4; c++) {
            EXPECT_DOUBLE_EQ(buffered.at(0, r + 2, c + 2), core.at(0, r, c));
        }
    }
    // Ring comes from the surrounding source cells
    EXPECT_DOUBLE_EQ(buffered.at(0, 0, 0), dem().value(0, 3, 4));
    EXPECT_DOUBLE_EQ(buffered.at(1, 7, 7), dem().value(1, 10, 11));
    EXPECT_EQ(buffered.core(0), core.core(0));
}

TEST_F(ChunkReaderTest, LeadingEdgeIsFilledWithNodata) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("dem.tif", 0, 5, 4, 4, 2);

    for (int r = 0; r < chunk.padded_rows(); r++) {
        EXPECT_DOUBLE_EQ(chunk.at(0, r, 0), -9999.0);
        EXPECT_DOUBLE_EQ(chunk.at(0, r, 1), -9999.0);
        EXPECT_DOUBLE_EQ(chunk.at(0, r, 2), dem().value(0, r + 3, 0));
        EXPECT_DOUBLE_EQ(chunk.at(0, r, 7), dem().value(0, r + 3, 5));
    }
}

TEST_F(ChunkReaderTest, FillIsZeroWithoutNodata) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("plain.tif", 0, 0, 3, 3, 1);

    EXPECT_FALSE(chunk.nodata.has_value());
    EXPECT_DOUBLE_EQ(chunk.fill_value(), 0.0);
    EXPECT_DOUBLE_EQ(chunk.at(0, 0, 0), 0.0);
    EXPECT_DOUBLE_EQ(chunk.at(0, 0, 2), 0.0);
    EXPECT_DOUBLE_EQ(chunk.at(0, 1, 1), 0.0);   // source pixel (0, 0) is also 0
    EXPECT_DOUBLE_EQ(chunk.at(0, 2, 2), 11.0);
    EXPECT_DOUBLE_EQ(chunk.at(0, 4, 4), 33.0);
}

TEST_F(ChunkReaderTest, WindowPastCornerOfSmallGrid) {
    gridchunk::ChunkReader reader(backend);
    auto chunk = reader.read("grid.tif", 8, 8, 4, 4, 2);

    ASSERT_EQ(chunk.padded_rows(), 8);
    ASSERT_EQ(chunk.padded_cols(), 8);
    const auto& src = backend->files.at("grid.tif");

    for (int r = 0; r < 8; r++) {
        for (int c = 0; c < 8; c++) {
            if (r < 4 && c < 4) {
                EXPECT_DOUBLE_EQ(chunk.at(0, r, c), src.value(0, r + 6, c + 6));
            } else {
                EXPECT_DOUBLE_EQ(chunk.at(0, r, c), -9999.0);
            }
        }
    }
}

TEST_F(ChunkReaderTest, ReadsEachBandOnce) {
    gridchunk::ChunkReader reader(backend);
    reader.read("dem.tif", 1, 1, 5, 5, 1);

    EXPECT_EQ(backend->read_calls, 2);
}

TEST_F(ChunkReaderTest, MissingSourceThrows) {
    gridchunk::ChunkReader reader(backend);

    EXPECT_THROW(reader.read("missing.tif"), gridchunk::BackendOpenFailure);
}

TEST_F(ChunkReaderTest, InvalidGeometryReleasesHandle) {
    gridchunk::ChunkReader reader(backend);

    EXPECT_THROW(reader.read("dem.tif", 40, 0, 4, 4, 2), gridchunk::InvalidWindowGeometry);
    EXPECT_EQ(backend->read_calls, 0);
    EXPECT_EQ(backend->open_handles, 0);
}

TEST_F(ChunkReaderTest, FailedBandReadReleasesHandle) {
    gridchunk::ChunkReader reader(backend);
    backend->fail_read_on_band = 2;

    EXPECT_THROW(reader.read("dem.tif", 2, 2, 4, 4, 1), gridchunk::BackendError);
    EXPECT_EQ(backend->read_calls, 2);
    EXPECT_EQ(backend->open_handles, 0);
}

TEST_F(ChunkReaderTest, HandleReleasedAfterRead) {
    gridchunk::ChunkReader reader(backend);
    for (int i = 0; i < 5; i++) {
        reader.read("dem.tif", i, i, 3, 3, 1);
    }

    EXPECT_EQ(backend->open_handles, 0);
}

TEST_F(ChunkReaderTest, ChunksDoNotShareBuffers) {
    gridchunk::ChunkReader reader(backend);
    auto a = reader.read("dem.tif", 0, 0, 4, 4, 0);
    auto b = reader.read("dem.tif", 0, 0, 4, 4, 0);

    a.at(0, 0, 0) = 42.0;
    EXPECT_NE(b.at(0, 0, 0), 42.0);
    EXPECT_NE(a.data.data(), b.data.data());
}
