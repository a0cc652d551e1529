#include "gridchunk/raster_chunk.hpp"

#include <algorithm>
#include <stdexcept>

namespace gridchunk {

std::vector<double> RasterChunk::core(int band) const {
    if (band < 0 || band >= bands) {
        throw std::out_of_range("Band index out of range: " + std::to_string(band));
    }

    std::vector<double> out(static_cast<size_t>(rows) * cols);
    const double* src = band_data(band);
    size_t row_stride = static_cast<size_t>(padded_cols());

    for (int r = 0; r < rows; r++) {
        const double* row_start = src + (r + buffer) * row_stride + buffer;
        std::copy(row_start, row_start + cols, out.begin() + static_cast<size_t>(r) * cols);
    }
    return out;
}

GeoTransformCoeffs RasterChunk::core_geotransform() const {
    GeoTransformCoeffs gt = geotransform;
    gt[0] = geotransform[0] + x_start * geotransform[1] + y_start * geotransform[2];
    gt[3] = geotransform[3] + x_start * geotransform[4] + y_start * geotransform[5];
    return gt;
}

} // namespace gridchunk
