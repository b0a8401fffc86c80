#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "ImageReader.h"

/// Reader for NumPy .npz archives (zip files of .npy arrays).
///
/// Every 2-D array, or every slice along the first axis of a stacked array,
/// becomes one plane, in archive order.  A trailing axis of length <= 4 is
/// read as colour channels.  Stored and deflated entries are supported; the
/// archive itself is walked directly and zlib does the inflating.
class NpzReader : public ImageReader
{
public:
    /// @throws std::runtime_error if the archive is unreadable or holds no
    ///         usable array.
    explicit NpzReader(const std::string& path);

    int planeCount() const override { return static_cast<int>(planes_.size()); }
    PixelBuffer readPlane(int index) override;
    std::string backendName() const override { return "zlib (npz)"; }

private:
    struct Entry
    {
        std::string name;
        uint16_t method = 0;
        uint64_t compressedSize = 0;
        uint64_t size = 0;
        uint64_t localOffset = 0;
    };

    struct ArrayInfo
    {
        size_t entry = 0;
        SampleType type = SampleType::UInt8;
        size_t itemSize = 1;
        bool bigEndian = false;
        size_t dataOffset = 0;  ///< Start of the samples inside the .npy payload.
        int planes = 1;
        int height = 0;
        int width = 0;
        int channels = 1;
        bool channelAxis = false;
    };

    void readCentralDirectory();
    const std::vector<unsigned char>& entryBytes(size_t entry);
    ArrayInfo parseArrayHeader(size_t entry, const std::vector<unsigned char>& npy) const;

    std::string path_;
    std::vector<unsigned char> file_;
    std::vector<Entry> entries_;
    std::vector<ArrayInfo> arrays_;
    std::vector<std::pair<size_t, int>> planes_;  ///< (array, slice) per plane.

    size_t cachedEntry_ = static_cast<size_t>(-1);
    std::vector<unsigned char> cachedBytes_;
};
