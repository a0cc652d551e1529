#include "gridchunk/window_planner.hpp"
#include "gridchunk/errors.hpp"

#include <climits>
#include <string>

namespace gridchunk {

namespace {
// The padded window, its end and its negated offset must all fit in int
bool fits_int(int start, int length, int buffer) {
    long long off = static_cast<long long>(start) - buffer;
    long long size = static_cast<long long>(length) + 2LL * buffer;
    return off > INT_MIN && size <= INT_MAX && off + size <= INT_MAX;
}
}

AxisPlan plan_axis(int start, int length, int buffer, int src_length) {
    if (!fits_int(start, length, buffer)) {
        throw InvalidWindowGeometry("Window too large: start " + std::to_string(start) +
                                    " length " + std::to_string(length) +
                                    " buffer " + std::to_string(buffer));
    }

    int off = start - buffer;
    int size = length + 2 * buffer;

    AxisPlan plan{off, size, 0, size};

    // Padded window starts before the source: leading cells stay as fill
    if (off < 0) {
        plan.read_off = 0;
        plan.read_size += off;
        plan.dst_start = -off;
    }
    // Padded window ends past the source: trailing cells stay as fill
    if (off + size > src_length) {
        int overhang = off + size - src_length;
        plan.read_size -= overhang;
        plan.dst_end = size - overhang;
    }
    return plan;
}

WindowPlan plan_window(int x_start, int y_start, int read_x, int read_y, int buffer,
                       int src_cols, int src_rows) {
    if (buffer < 0 || read_x < 0 || read_y < 0) {
        throw InvalidWindowGeometry("Negative window parameter: read_x=" + std::to_string(read_x) +
                                    " read_y=" + std::to_string(read_y) +
                                    " buffer=" + std::to_string(buffer));
    }
    if (src_cols <= 0 || src_rows <= 0) {
        throw InvalidWindowGeometry("Source raster is empty");
    }

    int cols = read_x ? read_x : src_cols;
    int rows = read_y ? read_y : src_rows;

    AxisPlan x = plan_axis(x_start, cols, buffer, src_cols);
    AxisPlan y = plan_axis(y_start, rows, buffer, src_rows);

    if (x.read_size <= 0 || y.read_size <= 0) {
        throw InvalidWindowGeometry("Window does not intersect the source: read size " +
                                    std::to_string(x.read_size) + "x" + std::to_string(y.read_size));
    }

    return WindowPlan{
        x.read_off, y.read_off, x.read_size, y.read_size,
        x.dst_start, x.dst_end, y.dst_start, y.dst_end
    };
}

} // namespace gridchunk
