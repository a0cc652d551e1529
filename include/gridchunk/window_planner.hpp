#pragma once

namespace gridchunk {

struct AxisPlan {
    int read_off;
    int read_size;
    int dst_start;
    int dst_end;    // exclusive
};

struct WindowPlan {
    int read_x_off;
    int read_y_off;
    int read_x_size;
    int read_y_size;

    // Slice of the padded destination buffer that receives the read rectangle
    int dst_x_start;
    int dst_x_end;
    int dst_y_start;
    int dst_y_end;
};

// Clamps one axis of a padded window [start - buffer, start + length + buffer)
// against a source extent of src_length cells. Throws InvalidWindowGeometry
// when the padded window does not fit in int.
AxisPlan plan_axis(int start, int length, int buffer, int src_length);

// read_x/read_y of 0 select the full source extent on that axis.
// Throws InvalidWindowGeometry when the clamped read is empty on either axis.
WindowPlan plan_window(int x_start, int y_start, int read_x, int read_y, int buffer,
                       int src_cols, int src_rows);

} // namespace gridchunk
