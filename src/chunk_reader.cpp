#include "gridchunk/chunk_reader.hpp"
#include "gridchunk/errors.hpp"
#include "gridchunk/logging.hpp"
#include "gridchunk/window_planner.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace gridchunk {

ChunkReader::ChunkReader(std::shared_ptr<RasterBackend> backend)
    : backend_(std::move(backend)) {}

RasterChunk ChunkReader::read(const std::string& source_path, int x_start, int y_start,
                              int read_x, int read_y, int buffer) const {
    std::unique_ptr<RasterSource> source = backend_->open(source_path);

    // Planned against the source extent, before anything is allocated
    WindowPlan plan = plan_window(x_start, y_start, read_x, read_y, buffer,
                                  source->cols(), source->rows());

    RasterChunk chunk;
    chunk.rows = read_y ? read_y : source->rows();
    chunk.cols = read_x ? read_x : source->cols();
    chunk.buffer = buffer;
    chunk.x_start = x_start;
    chunk.y_start = y_start;

    chunk.bands = source->band_count();
    chunk.geotransform = source->geotransform();
    chunk.projection = source->projection();
    chunk.cell_size = std::abs(chunk.geotransform[5]);
    chunk.driver_id = source->driver_id();
    if (chunk.bands > 0) {
        chunk.nodata = source->nodata(1);
        chunk.data_type = source->data_type(1);
    }

    logger()->debug("Reading {} ({}): core {}x{} at ({}, {}), buffer {}, bands {}",
                    source_path, chunk.driver_id, chunk.cols, chunk.rows,
                    x_start, y_start, buffer, chunk.bands);
    logger()->debug("Source window x:[{}, {}) y:[{}, {}) -> destination x:[{}, {}) y:[{}, {})",
                    plan.read_x_off, plan.read_x_off + plan.read_x_size,
                    plan.read_y_off, plan.read_y_off + plan.read_y_size,
                    plan.dst_x_start, plan.dst_x_end, plan.dst_y_start, plan.dst_y_end);

    chunk.data.assign(static_cast<size_t>(chunk.bands) * chunk.band_stride(), chunk.fill_value());

    for (int band = 1; band <= chunk.bands; band++) {
        std::vector<double> window = source->read_window(band, plan.read_x_off, plan.read_y_off,
                                                         plan.read_x_size, plan.read_y_size);
        if (window.size() != static_cast<size_t>(plan.read_x_size) * plan.read_y_size) {
            throw BackendError("Band " + std::to_string(band) + " of " + source_path +
                               " returned " + std::to_string(window.size()) + " values");
        }

        for (int r = 0; r < plan.read_y_size; r++) {
            auto src_row = window.begin() + static_cast<size_t>(r) * plan.read_x_size;
            std::copy(src_row, src_row + plan.read_x_size,
                      &chunk.at(band - 1, plan.dst_y_start + r, plan.dst_x_start));
        }
    }

    return chunk;
}

} // namespace gridchunk
