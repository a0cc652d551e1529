#pragma once

#include "gridchunk/backend.hpp"
#include "gridchunk/raster_chunk.hpp"

#include <memory>
#include <string>

namespace gridchunk {

class ChunkReader {
public:
    explicit ChunkReader(std::shared_ptr<RasterBackend> backend);

    // Reads the window [x_start, x_start + read_x) x [y_start, y_start + read_y)
    // plus `buffer` cells on every side. read_x/read_y of 0 mean the full source
    // extent. Cells outside the source hold nodata, or 0 when the source has none.
    // nodata and data_type are taken from band 1 and assumed uniform across bands.
    RasterChunk read(const std::string& source_path, int x_start = 0, int y_start = 0,
                     int read_x = 0, int read_y = 0, int buffer = 0) const;

private:
    std::shared_ptr<RasterBackend> backend_;
};

} // namespace gridchunk
