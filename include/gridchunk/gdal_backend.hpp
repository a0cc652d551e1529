#pragma once

#include "gridchunk/backend.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gridchunk {

// RasterBackend over GDAL. Pixels cross the boundary as GDT_Float64 and are
// converted by GDAL to and from the dataset's own type.
class GdalBackend : public RasterBackend {
public:
    GdalBackend();

    std::unique_ptr<RasterSource> open(const std::string& path) override;
    std::unique_ptr<RasterSink> create(const std::string& path, const std::string& driver_id,
                                       int cols, int rows, int bands,
                                       const std::string& data_type,
                                       const std::vector<std::string>& options) override;

    bool exists(const std::string& path) const override;
    void remove(const std::string& path) override;
    bool can_create(const std::string& driver_id) const override;
};

} // namespace gridchunk
