#pragma once

#include "gridchunk/backend.hpp"
#include "gridchunk/chunk_reader.hpp"
#include "gridchunk/chunk_writer.hpp"
#include "gridchunk/errors.hpp"
#include "gridchunk/gdal_backend.hpp"
#include "gridchunk/logging.hpp"
#include "gridchunk/raster_chunk.hpp"
#include "gridchunk/window_planner.hpp"

#include <string>

namespace gridchunk {

constexpr const char* VERSION = "0.1.0";

// Convenience entry points over a shared GdalBackend
RasterChunk read_chunk(const std::string& source_path, int x_start = 0, int y_start = 0,
                       int read_x = 0, int read_y = 0, int buffer = 0);

void write_chunk(const RasterChunk& chunk, const std::string& out_path,
                 const WriterOptions& options = {});

} // namespace gridchunk
