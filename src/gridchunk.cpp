#include "gridchunk/gridchunk.hpp"

#include <memory>

namespace gridchunk {

namespace {
std::shared_ptr<RasterBackend> default_backend() {
    static auto backend = std::make_shared<GdalBackend>();
    return backend;
}
}

RasterChunk read_chunk(const std::string& source_path, int x_start, int y_start,
                       int read_x, int read_y, int buffer) {
    return ChunkReader(default_backend()).read(source_path, x_start, y_start, read_x, read_y, buffer);
}

void write_chunk(const RasterChunk& chunk, const std::string& out_path, const WriterOptions& options) {
    ChunkWriter(default_backend(), options).write(chunk, out_path);
}

} // namespace gridchunk
