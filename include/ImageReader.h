#pragma once

#include <memory>
#include <string>

#include "PixelBuffer.h"

/// Abstract image decoder.
///
/// A reader is opened once per file and then asked for individual planes
/// (pages of a TIFF stack, frames of a GIF, arrays of an .npz archive).
/// Concrete implementations exist per decoding library.
class ImageReader
{
public:
    virtual ~ImageReader() = default;

    /// Number of planes in the file (1 for a plain 2-D image).
    virtual int planeCount() const = 0;

    /// Decode one plane.  planeIndex/planeCount of the result are filled in.
    /// @throws std::runtime_error on decode failure or a bad index.
    virtual PixelBuffer readPlane(int index) = 0;

    /// Short name of the decoding backend, for the info dialog and logs.
    virtual std::string backendName() const = 0;

    // --- Factory ---

    /// Open a file with the backend matching its extension.  TIFF files are
    /// inspected to pick the uncompressed or the compressed backend.
    /// @throws std::runtime_error if the file cannot be opened or no
    ///         backend handles the format.
    static std::unique_ptr<ImageReader> open(const std::string& path);
};
