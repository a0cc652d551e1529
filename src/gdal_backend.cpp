#include "gridchunk/gdal_backend.hpp"
#include "gridchunk/errors.hpp"
#include "gridchunk/logging.hpp"

#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal.h>
#include <gdal_priv.h>

#include <mutex>
#include <utility>

namespace gridchunk {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* dset) const {
        if (dset) GDALClose(GDALDataset::ToHandle(dset));
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

struct TypeName {
    GDALDataType type;
    const char* name;
};

constexpr TypeName TYPE_NAMES[] = {
    {GDT_Byte, "uint8"},
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0)
    {GDT_Int8, "int8"},
#endif
    {GDT_UInt16, "uint16"},
    {GDT_Int16, "int16"},
    {GDT_UInt32, "uint32"},
    {GDT_Int32, "int32"},
    {GDT_Float32, "float32"},
    {GDT_Float64, "float64"},
};

std::string type_to_name(GDALDataType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    throw BackendError(std::string("Unsupported pixel type: ") + GDALGetDataTypeName(type));
}

GDALDataType name_to_type(const std::string& name) {
    for (const auto& entry : TYPE_NAMES) {
        if (name == entry.name) return entry.type;
    }
    throw BackendError("Unsupported pixel type: " + name);
}

std::string last_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? msg : "unknown GDAL error";
}

void CPL_STDCALL forward_gdal_error(CPLErr level, CPLErrorNum code, const char* msg) {
    if (level == CE_Warning) {
        logger()->warn("GDAL [{}]: {}", code, msg);
    } else if (level >= CE_Failure) {
        logger()->error("GDAL [{}]: {}", code, msg);
    }
}

// Routes GDAL messages to our logger for the duration of one backend call,
// leaving whatever handler the host process installed in place afterwards.
// The last-error state read by last_error() is kept either way.
class ScopedErrorHandler {
public:
    ScopedErrorHandler() { CPLPushErrorHandler(forward_gdal_error); }
    ~ScopedErrorHandler() { CPLPopErrorHandler(); }

    ScopedErrorHandler(const ScopedErrorHandler&) = delete;
    ScopedErrorHandler& operator=(const ScopedErrorHandler&) = delete;
};

class GdalSource : public RasterSource {
public:
    GdalSource(DatasetPtr dset, std::string path)
        : dset_(std::move(dset))
        , path_(std::move(path)) {}

    int cols() const override { return dset_->GetRasterXSize(); }
    int rows() const override { return dset_->GetRasterYSize(); }
    int band_count() const override { return dset_->GetRasterCount(); }

    GeoTransformCoeffs geotransform() const override {
        ScopedErrorHandler errors;
        GeoTransformCoeffs gt{};
        if (dset_->GetGeoTransform(gt.data()) != CE_None) {
            // GDAL leaves the identity transform in place
            logger()->debug("{} has no geotransform", path_);
        }
        return gt;
    }

    std::string projection() const override {
        const char* wkt = dset_->GetProjectionRef();
        return wkt ? wkt : "";
    }

    std::string driver_id() const override {
        GDALDriver* driver = dset_->GetDriver();
        return driver ? driver->GetDescription() : "";
    }

    std::optional<double> nodata(int band) const override {
        int has_nodata = 0;
        double value = get_band(band)->GetNoDataValue(&has_nodata);
        if (!has_nodata) return std::nullopt;
        return value;
    }

    std::string data_type(int band) const override {
        return type_to_name(get_band(band)->GetRasterDataType());
    }

    std::vector<double> read_window(int band, int x_off, int y_off,
                                    int x_size, int y_size) const override {
        ScopedErrorHandler errors;
        std::vector<double> values(static_cast<size_t>(x_size) * y_size);
        CPLErr err = get_band(band)->RasterIO(GF_Read, x_off, y_off, x_size, y_size,
                                              values.data(), x_size, y_size, GDT_Float64,
                                              0, 0, nullptr);
        if (err != CE_None) {
            throw BackendError("RasterIO read failed on band " + std::to_string(band) +
                               " of " + path_ + ": " + last_error());
        }
        return values;
    }

private:
    GDALRasterBand* get_band(int band) const {
        GDALRasterBand* b = dset_->GetRasterBand(band);
        if (!b) throw BackendError("No band " + std::to_string(band) + " in " + path_);
        return b;
    }

    DatasetPtr dset_;
    std::string path_;
};

class GdalSink : public RasterSink {
public:
    GdalSink(DatasetPtr dset, std::string path)
        : dset_(std::move(dset))
        , path_(std::move(path)) {}

    void set_geotransform(const GeoTransformCoeffs& transform) override {
        ScopedErrorHandler errors;
        GeoTransformCoeffs gt = transform;
        if (dataset()->SetGeoTransform(gt.data()) != CE_None) {
            throw BackendError("Failed to set geotransform on " + path_ + ": " + last_error());
        }
    }

    void set_projection(const std::string& projection) override {
        ScopedErrorHandler errors;
        if (projection.empty()) return;
        if (dataset()->SetProjection(projection.c_str()) != CE_None) {
            throw BackendError("Failed to set projection on " + path_ + ": " + last_error());
        }
    }

    void set_nodata(int band, double value) override {
        ScopedErrorHandler errors;
        if (get_band(band)->SetNoDataValue(value) != CE_None) {
            throw BackendError("Failed to set nodata on band " + std::to_string(band) +
                               " of " + path_ + ": " + last_error());
        }
    }

    void write_window(int band, int x_off, int y_off, int x_size, int y_size,
                      const std::vector<double>& values) override {
        ScopedErrorHandler errors;
        if (values.size() != static_cast<size_t>(x_size) * y_size) {
            throw BackendError("Write buffer holds " + std::to_string(values.size()) +
                               " values for a " + std::to_string(x_size) + "x" +
                               std::to_string(y_size) + " window");
        }
        // RasterIO takes a non-const buffer even for writes
        CPLErr err = get_band(band)->RasterIO(GF_Write, x_off, y_off, x_size, y_size,
                                              const_cast<double*>(values.data()),
                                              x_size, y_size, GDT_Float64, 0, 0, nullptr);
        if (err != CE_None) {
            throw BackendError("RasterIO write failed on band " + std::to_string(band) +
                               " of " + path_ + ": " + last_error());
        }
    }

    void close() override {
        if (!dset_) return;
        ScopedErrorHandler errors;
        CPLErrorReset();
        dset_.reset();
        if (CPLGetLastErrorType() >= CE_Failure) {
            throw BackendError("Failed to close " + path_ + ": " + last_error());
        }
    }

private:
    GDALDataset* dataset() const {
        if (!dset_) throw BackendError(path_ + " is already closed");
        return dset_.get();
    }

    GDALRasterBand* get_band(int band) const {
        GDALRasterBand* b = dataset()->GetRasterBand(band);
        if (!b) throw BackendError("No band " + std::to_string(band) + " in " + path_);
        return b;
    }

    DatasetPtr dset_;
    std::string path_;
};

} // namespace

GdalBackend::GdalBackend() {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });
}

std::unique_ptr<RasterSource> GdalBackend::open(const std::string& path) {
    ScopedErrorHandler errors;
    CPLErrorReset();
    GDALDataset* dset = GDALDataset::FromHandle(
        GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
    if (!dset) {
        throw BackendOpenFailure("Failed to open raster " + path + ": " + last_error());
    }
    logger()->debug("Opened {}", path);
    return std::make_unique<GdalSource>(DatasetPtr(dset), path);
}

std::unique_ptr<RasterSink> GdalBackend::create(const std::string& path, const std::string& driver_id,
                                                int cols, int rows, int bands,
                                                const std::string& data_type,
                                                const std::vector<std::string>& options) {
    ScopedErrorHandler errors;
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_id.c_str());
    if (!driver) {
        throw BackendError("No GDAL driver named " + driver_id);
    }

    CPLStringList create_options;
    for (const auto& opt : options) {
        create_options.AddString(opt.c_str());
    }

    CPLErrorReset();
    GDALDataset* dset = driver->Create(path.c_str(), cols, rows, bands, name_to_type(data_type),
                                       create_options.List());
    if (!dset) {
        throw BackendError("Failed to create " + path + " with " + driver_id + ": " + last_error());
    }
    logger()->debug("Created {} ({}x{}x{}, {})", path, cols, rows, bands, data_type);
    return std::make_unique<GdalSink>(DatasetPtr(dset), path);
}

bool GdalBackend::exists(const std::string& path) const {
    VSIStatBufL stat;
    return VSIStatL(path.c_str(), &stat) == 0;
}

void GdalBackend::remove(const std::string& path) {
    ScopedErrorHandler errors;
    // Let the driver drop any sidecar files it created alongside the main file
    GDALDriverH driver = GDALIdentifyDriver(path.c_str(), nullptr);
    if (driver && GDALDeleteDataset(driver, path.c_str()) == CE_None) {
        return;
    }
    if (exists(path) && VSIUnlink(path.c_str()) != 0) {
        throw BackendError("Failed to remove " + path);
    }
}

bool GdalBackend::can_create(const std::string& driver_id) const {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_id.c_str());
    return driver && driver->GetMetadataItem(GDAL_DCAP_CREATE) != nullptr;
}

} // namespace gridchunk
