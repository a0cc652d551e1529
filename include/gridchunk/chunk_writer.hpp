#pragma once

#include "gridchunk/backend.hpp"
#include "gridchunk/raster_chunk.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gridchunk {

struct WriterOptions {
    // Used when the source driver is virtual or cannot create datasets
    std::string fallback_driver = "GTiff";
    std::vector<std::string> virtual_drivers = {"VRT", "MEM"};
    std::vector<std::string> creation_options = {"TILED=YES", "BIGTIFF=YES"};
};

class ChunkWriter {
public:
    explicit ChunkWriter(std::shared_ptr<RasterBackend> backend, WriterOptions options = {});

    // Writes the unbuffered core of `chunk` to a new file at out_path.
    // Throws AlreadyExists if out_path exists; nothing is touched in that case.
    // On a failed band write the partial output is removed and
    // PartialWriteFailure is thrown.
    void write(const RasterChunk& chunk, const std::string& out_path) const;

    // Driver the chunk will be written with
    std::string output_driver(const RasterChunk& chunk) const;

    const WriterOptions& options() const { return options_; }

private:
    void write_contents(RasterSink& sink, const RasterChunk& chunk, const std::string& out_path) const;

    std::shared_ptr<RasterBackend> backend_;
    WriterOptions options_;
};

} // namespace gridchunk
