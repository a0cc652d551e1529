#pragma once

#include <stdexcept>
#include <string>

namespace gridchunk {

class ChunkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source path missing or not a readable raster
class BackendOpenFailure : public ChunkError {
public:
    using ChunkError::ChunkError;
};

// Clamped read rectangle is empty, or a window parameter is negative
class InvalidWindowGeometry : public ChunkError {
public:
    using ChunkError::ChunkError;
};

// Output path collision, raised before anything is written
class AlreadyExists : public ChunkError {
public:
    using ChunkError::ChunkError;
};

// A band write failed; the partial output has already been removed
class PartialWriteFailure : public ChunkError {
public:
    using ChunkError::ChunkError;
};

// Any other failure reported by the raster backend
class BackendError : public ChunkError {
public:
    using ChunkError::ChunkError;
};

} // namespace gridchunk
