#pragma once

#include "gridchunk/backend.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gridchunk {

// One buffered window of a raster, held in memory. rows/cols are the core
// window; data covers (bands, rows + 2*buffer, cols + 2*buffer), band-major
// then row-major. Band indices here are 0-based.
struct RasterChunk {
    int rows = 0;
    int cols = 0;
    int buffer = 0;
    int bands = 0;
    int x_start = 0;
    int y_start = 0;

    std::string data_type;
    GeoTransformCoeffs geotransform{};
    std::string projection;
    double cell_size = 0.0;
    std::optional<double> nodata;
    std::string driver_id;

    std::vector<double> data;

    int padded_rows() const { return rows + 2 * buffer; }
    int padded_cols() const { return cols + 2 * buffer; }
    size_t band_stride() const {
        return static_cast<size_t>(padded_rows()) * padded_cols();
    }

    double fill_value() const { return nodata.value_or(0.0); }

    double at(int band, int row, int col) const {
        return data[band * band_stride() + static_cast<size_t>(row) * padded_cols() + col];
    }
    double& at(int band, int row, int col) {
        return data[band * band_stride() + static_cast<size_t>(row) * padded_cols() + col];
    }

    const double* band_data(int band) const { return data.data() + band * band_stride(); }

    // Copy of the unbuffered rows x cols region of one band
    std::vector<double> core(int band) const;

    // Transform whose origin is the core window's upper-left pixel
    GeoTransformCoeffs core_geotransform() const;
};

} // namespace gridchunk
