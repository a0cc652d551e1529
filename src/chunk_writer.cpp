#include "gridchunk/chunk_writer.hpp"
#include "gridchunk/errors.hpp"
#include "gridchunk/logging.hpp"

#include <algorithm>
#include <utility>

namespace gridchunk {

ChunkWriter::ChunkWriter(std::shared_ptr<RasterBackend> backend, WriterOptions options)
    : backend_(std::move(backend))
    , options_(std::move(options)) {}

std::string ChunkWriter::output_driver(const RasterChunk& chunk) const {
    const auto& virt = options_.virtual_drivers;
    bool is_virtual = std::find(virt.begin(), virt.end(), chunk.driver_id) != virt.end();

    if (chunk.driver_id.empty() || is_virtual || !backend_->can_create(chunk.driver_id)) {
        logger()->info("Driver '{}' cannot be written directly, using {}",
                       chunk.driver_id, options_.fallback_driver);
        return options_.fallback_driver;
    }
    return chunk.driver_id;
}

void ChunkWriter::write(const RasterChunk& chunk, const std::string& out_path) const {
    if (backend_->exists(out_path)) {
        throw AlreadyExists("Output already exists: " + out_path);
    }

    std::string driver = output_driver(chunk);
    logger()->debug("Writing {}x{}x{} {} core to {} ({})",
                    chunk.cols, chunk.rows, chunk.bands, chunk.data_type, out_path, driver);

    std::unique_ptr<RasterSink> sink = backend_->create(out_path, driver, chunk.cols, chunk.rows,
                                                        chunk.bands, chunk.data_type,
                                                        options_.creation_options);
    try {
        write_contents(*sink, chunk, out_path);
        sink->close();
    } catch (const std::exception& e) {
        logger()->warn("Write to {} failed, removing partial output: {}", out_path, e.what());
        sink.reset();
        try {
            backend_->remove(out_path);
        } catch (const std::exception& cleanup) {
            logger()->error("Could not remove {}: {}", out_path, cleanup.what());
        }
        throw;
    }
}

void ChunkWriter::write_contents(RasterSink& sink, const RasterChunk& chunk,
                                 const std::string& out_path) const {
    sink.set_geotransform(chunk.core_geotransform());
    sink.set_projection(chunk.projection);

    for (int band = 1; band <= chunk.bands; band++) {
        try {
            if (chunk.nodata) {
                sink.set_nodata(band, *chunk.nodata);
            }
            sink.write_window(band, 0, 0, chunk.cols, chunk.rows, chunk.core(band - 1));
        } catch (const std::exception& e) {
            throw PartialWriteFailure("Band " + std::to_string(band) + " of " + out_path +
                                      ": " + e.what());
        }
    }
}

} // namespace gridchunk
