#include "NpzReader.h"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <string>

#include <zlib.h>

namespace {

constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint32_t kCentralDirSig = 0x02014b50;
constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint16_t kZip64ExtraId = 0x0001;

uint16_t le16(const unsigned char* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const unsigned char* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t le64(const unsigned char* p)
{
    return static_cast<uint64_t>(le32(p)) | (static_cast<uint64_t>(le32(p + 4)) << 32);
}

bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Read one sample of the given numpy type and byte order as double.
double readSample(const unsigned char* p, SampleType type, size_t itemSize, bool bigEndian)
{
    unsigned char tmp[8];
    std::memcpy(tmp, p, itemSize);
    if (bigEndian)
        std::reverse(tmp, tmp + itemSize);

    switch (type)
    {
    case SampleType::UInt8:   return static_cast<double>(tmp[0]);
    case SampleType::Int8:    return static_cast<double>(static_cast<int8_t>(tmp[0]));
    case SampleType::UInt16:  { uint16_t v; std::memcpy(&v, tmp, 2); return static_cast<double>(v); }
    case SampleType::Int16:   { int16_t v;  std::memcpy(&v, tmp, 2); return static_cast<double>(v); }
    case SampleType::UInt32:  { uint32_t v; std::memcpy(&v, tmp, 4); return static_cast<double>(v); }
    case SampleType::Int32:   { int32_t v;  std::memcpy(&v, tmp, 4); return static_cast<double>(v); }
    case SampleType::Float32: { float v;    std::memcpy(&v, tmp, 4); return static_cast<double>(v); }
    case SampleType::Float64: { double v;   std::memcpy(&v, tmp, 8); return v; }
    }
    return 0.0f;
}

} // namespace

NpzReader::NpzReader(const std::string& path)
    : path_(path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw std::runtime_error("Cannot open archive: " + path);
    file_.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());

    readCentralDirectory();

    for (size_t e = 0; e < entries_.size(); ++e)
    {
        if (!endsWith(entries_[e].name, ".npy"))
            continue;
        ArrayInfo info = parseArrayHeader(e, entryBytes(e));
        size_t ai = arrays_.size();
        arrays_.push_back(info);
        for (int s = 0; s < info.planes; ++s)
            planes_.emplace_back(ai, s);
    }

    if (planes_.empty())
        throw std::runtime_error("Archive contains no image arrays: " + path);
}

void NpzReader::readCentralDirectory()
{
    if (file_.size() < 22)
        throw std::runtime_error("Not a zip archive: " + path_);

    // The end record sits in the last 64 KiB + 22 bytes (comment max).
    size_t searchStart = file_.size() > 0xFFFF + 22 ? file_.size() - (0xFFFF + 22) : 0;
    size_t eocd = std::string::npos;
    for (size_t i = file_.size() - 22 + 1; i-- > searchStart;)
    {
        if (le32(&file_[i]) == kEndOfCentralDirSig)
        {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos)
        throw std::runtime_error("Zip end record not found in " + path_);

    uint16_t count = le16(&file_[eocd + 10]);
    size_t pos = le32(&file_[eocd + 16]);

    for (uint16_t i = 0; i < count; ++i)
    {
        if (pos + 46 > file_.size() || le32(&file_[pos]) != kCentralDirSig)
            throw std::runtime_error("Corrupt zip central directory in " + path_);

        const unsigned char* h = &file_[pos];
        Entry e;
        e.method = le16(h + 10);
        e.compressedSize = le32(h + 20);
        e.size = le32(h + 24);
        uint16_t nameLen = le16(h + 28);
        uint16_t extraLen = le16(h + 30);
        uint16_t commentLen = le16(h + 32);
        e.localOffset = le32(h + 42);
        if (pos + 46 + nameLen + extraLen > file_.size())
            throw std::runtime_error("Corrupt zip central directory in " + path_);
        e.name.assign(reinterpret_cast<const char*>(h + 46), nameLen);

        // Zip64 extra field: present values replace the 0xFFFFFFFF markers,
        // in the order size, compressed size, local offset.
        const unsigned char* extra = h + 46 + nameLen;
        for (size_t x = 0; x + 4 <= extraLen;)
        {
            uint16_t id = le16(extra + x);
            uint16_t len = le16(extra + x + 2);
            if (x + 4 + len > extraLen)
                throw std::runtime_error("Corrupt zip extra field in " + path_);
            if (id == kZip64ExtraId)
            {
                const unsigned char* v = extra + x + 4;
                const unsigned char* end = v + len;
                if (e.size == 0xFFFFFFFFu && v + 8 <= end) { e.size = le64(v); v += 8; }
                if (e.compressedSize == 0xFFFFFFFFu && v + 8 <= end) { e.compressedSize = le64(v); v += 8; }
                if (e.localOffset == 0xFFFFFFFFu && v + 8 <= end) { e.localOffset = le64(v); }
            }
            x += 4 + len;
        }

        entries_.push_back(e);
        pos += 46 + nameLen + extraLen + commentLen;
    }
}

const std::vector<unsigned char>& NpzReader::entryBytes(size_t entry)
{
    if (entry == cachedEntry_)
        return cachedBytes_;

    const Entry& e = entries_[entry];
    if (e.localOffset + 30 > file_.size() || le32(&file_[e.localOffset]) != kLocalHeaderSig)
        throw std::runtime_error("Corrupt zip entry " + e.name + " in " + path_);

    const unsigned char* lh = &file_[e.localOffset];
    size_t dataStart = e.localOffset + 30 + le16(lh + 26) + le16(lh + 28);
    if (dataStart + e.compressedSize > file_.size())
        throw std::runtime_error("Truncated zip entry " + e.name + " in " + path_);

    std::vector<unsigned char> out(static_cast<size_t>(e.size));
    if (e.method == 0)
    {
        if (e.size != e.compressedSize)
            throw std::runtime_error("Inconsistent sizes for stored entry " + e.name + " in " + path_);
        std::memcpy(out.data(), &file_[dataStart], out.size());
    }
    else if (e.method == 8)
    {
        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
            throw std::runtime_error("inflateInit2 failed");
        zs.next_in = const_cast<Bytef*>(&file_[dataStart]);
        zs.avail_in = static_cast<uInt>(e.compressedSize);
        zs.next_out = out.data();
        zs.avail_out = static_cast<uInt>(out.size());
        int rc = inflate(&zs, Z_FINISH);
        inflateEnd(&zs);
        if (rc != Z_STREAM_END)
            throw std::runtime_error("Failed to inflate " + e.name + " in " + path_);
    }
    else
    {
        throw std::runtime_error("Unsupported zip compression method " +
                                 std::to_string(e.method) + " for " + e.name);
    }

    cachedEntry_ = entry;
    cachedBytes_ = std::move(out);
    return cachedBytes_;
}

NpzReader::ArrayInfo NpzReader::parseArrayHeader(size_t entry, const std::vector<unsigned char>& npy) const
{
    const std::string& name = entries_[entry].name;
    if (npy.size() < 10 || std::memcmp(npy.data(), "\x93NUMPY", 6) != 0)
        throw std::runtime_error("Not a .npy array: " + name);

    int major = npy[6];
    size_t headerLen = 0;
    size_t headerStart = 0;
    if (major == 1)
    {
        headerLen = le16(&npy[8]);
        headerStart = 10;
    }
    else
    {
        if (npy.size() < 12)
            throw std::runtime_error("Truncated .npy header: " + name);
        headerLen = le32(&npy[8]);
        headerStart = 12;
    }
    if (headerStart + headerLen > npy.size())
        throw std::runtime_error("Truncated .npy header: " + name);

    std::string header(reinterpret_cast<const char*>(&npy[headerStart]), headerLen);

    std::smatch m;
    if (!std::regex_search(header, m, std::regex(R"('descr'\s*:\s*'([<>|=])([a-z])(\d+)')")))
        throw std::runtime_error("Missing dtype in .npy header: " + name);
    char order = m[1].str()[0];
    char kind = m[2].str()[0];
    int bytes = std::stoi(m[3].str());

    if (std::regex_search(header, m, std::regex(R"('fortran_order'\s*:\s*True)")))
        throw std::runtime_error("Fortran-ordered arrays are not supported: " + name);

    if (!std::regex_search(header, m, std::regex(R"('shape'\s*:\s*\(([^)]*)\))")))
        throw std::runtime_error("Missing shape in .npy header: " + name);
    std::vector<int> shape;
    std::string dims = m[1].str();
    std::regex num(R"(\d+)");
    for (auto it = std::sregex_iterator(dims.begin(), dims.end(), num);
         it != std::sregex_iterator(); ++it)
    {
        const std::string digits = it->str();
        int dim = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), dim);
        if (ec != std::errc())
            throw std::runtime_error("Array dimension out of range in " + name);
        shape.push_back(dim);
    }

    ArrayInfo info;
    info.entry = entry;
    info.itemSize = static_cast<size_t>(bytes);
    info.bigEndian = order == '>';
    info.dataOffset = headerStart + headerLen;

    if ((kind == 'u' || kind == 'b') && bytes == 1) info.type = SampleType::UInt8;
    else if (kind == 'i' && bytes == 1) info.type = SampleType::Int8;
    else if (kind == 'u' && bytes == 2) info.type = SampleType::UInt16;
    else if (kind == 'i' && bytes == 2) info.type = SampleType::Int16;
    else if (kind == 'u' && bytes == 4) info.type = SampleType::UInt32;
    else if (kind == 'i' && bytes == 4) info.type = SampleType::Int32;
    else if (kind == 'f' && bytes == 4) info.type = SampleType::Float32;
    else if (kind == 'f' && bytes == 8) info.type = SampleType::Float64;
    else
        throw std::runtime_error("Unsupported dtype " + std::string(1, kind) +
                                 std::to_string(bytes) + " in " + name);

    switch (shape.size())
    {
    case 2:
        info.height = shape[0];
        info.width = shape[1];
        break;
    case 3:
        if (shape[2] <= 4)
        {
            info.height = shape[0];
            info.width = shape[1];
            info.channels = shape[2];
            info.channelAxis = true;
        }
        else
        {
            info.planes = shape[0];
            info.height = shape[1];
            info.width = shape[2];
        }
        break;
    case 4:
        info.planes = shape[0];
        info.height = shape[1];
        info.width = shape[2];
        info.channels = shape[3];
        info.channelAxis = true;
        break;
    default:
        throw std::runtime_error("Array " + name + " is not an image (ndim " +
                                 std::to_string(shape.size()) + ")");
    }

    if (info.width <= 0 || info.height <= 0 || info.planes <= 0 || info.channels <= 0)
        throw std::runtime_error("Array " + name + " has an empty shape");

    // Every factor is positive, so dividing the remaining room keeps the
    // product below the entry size without overflowing.
    size_t room = npy.size() - info.dataOffset;
    for (size_t factor : {static_cast<size_t>(info.planes), static_cast<size_t>(info.height),
                          static_cast<size_t>(info.width), static_cast<size_t>(info.channels),
                          info.itemSize})
    {
        if (factor > room)
            throw std::runtime_error("Array data is truncated: " + name);
        room /= factor;
    }
    return info;
}

PixelBuffer NpzReader::readPlane(int index)
{
    if (index < 0 || index >= planeCount())
        throw std::runtime_error("Plane index out of range: " + std::to_string(index));

    const auto [arrayIndex, slice] = planes_[index];
    const ArrayInfo& info = arrays_[arrayIndex];
    const std::vector<unsigned char>& npy = entryBytes(info.entry);

    PixelBuffer buf(info.width, info.height, info.channels, info.type);
    buf.hasChannelAxis = info.channelAxis;
    buf.planeIndex = index;
    buf.planeCount = planeCount();

    const size_t planeSamples = buf.data.size();
    const unsigned char* src = npy.data() + info.dataOffset +
                               static_cast<size_t>(slice) * planeSamples * info.itemSize;
    for (size_t i = 0; i < planeSamples; ++i)
        buf.data[i] = readSample(src + i * info.itemSize, info.type, info.itemSize, info.bigEndian);
    return buf;
}
