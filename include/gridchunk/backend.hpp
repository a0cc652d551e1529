#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gridchunk {

using GeoTransformCoeffs = std::array<double, 6>;

// Read-only handle on an open raster. Bands are numbered from 1.
// Releasing the handle (destruction) closes the underlying dataset.
class RasterSource {
public:
    virtual ~RasterSource() = default;

    virtual int cols() const = 0;
    virtual int rows() const = 0;
    virtual int band_count() const = 0;

    virtual GeoTransformCoeffs geotransform() const = 0;
    virtual std::string projection() const = 0;
    virtual std::string driver_id() const = 0;

    virtual std::optional<double> nodata(int band) const = 0;
    virtual std::string data_type(int band) const = 0;

    // Row-major x_size * y_size values
    virtual std::vector<double> read_window(int band, int x_off, int y_off,
                                            int x_size, int y_size) const = 0;
};

// Writable handle on a freshly created raster. Bands are numbered from 1.
class RasterSink {
public:
    virtual ~RasterSink() = default;

    virtual void set_geotransform(const GeoTransformCoeffs& transform) = 0;
    virtual void set_projection(const std::string& projection) = 0;
    virtual void set_nodata(int band, double value) = 0;
    virtual void write_window(int band, int x_off, int y_off, int x_size, int y_size,
                              const std::vector<double>& values) = 0;

    // Flushes and releases the dataset; throws if the flush fails
    virtual void close() = 0;
};

class RasterBackend {
public:
    virtual ~RasterBackend() = default;

    virtual std::unique_ptr<RasterSource> open(const std::string& path) = 0;
    virtual std::unique_ptr<RasterSink> create(const std::string& path, const std::string& driver_id,
                                               int cols, int rows, int bands,
                                               const std::string& data_type,
                                               const std::vector<std::string>& options) = 0;

    virtual bool exists(const std::string& path) const = 0;
    virtual void remove(const std::string& path) = 0;
    virtual bool can_create(const std::string& driver_id) const = 0;
};

} // namespace gridchunk
