#include "slide_ingest/io/exif_reader.hpp"
#include "slide_ingest/core/errors.hpp"

#include <array>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace slide_ingest::io {

namespace {

constexpr uint16_t kTagDateTime = 0x0132;
constexpr uint16_t kTagExifIfd = 0x8769;
constexpr uint16_t kTagDateTimeOriginal = 0x9003;
constexpr uint16_t kTagDateTimeDigitized = 0x9004;

constexpr uint16_t kTypeAscii = 2;
constexpr uint16_t kTypeLong = 4;

constexpr uint16_t kMaxEntries = 1024;
constexpr uint32_t kMaxAsciiLength = 64;

class TiffStream {
public:
    explicit TiffStream(std::istream& in) : in_(in), base_(in.tellg()) {}

    bool read_header(uint32_t& ifd0) {
        char order[2];
        if (!read_raw(0, order, 2)) return false;
        if (order[0] == 'I' && order[1] == 'I') {
            little_ = true;
        } else if (order[0] == 'M' && order[1] == 'M') {
            little_ = false;
        } else {
            return false;
        }
        uint16_t magic = 0;
        if (!u16(2, magic) || magic != 42) return false;
        return u32(4, ifd0);
    }

    bool u16(uint32_t offset, uint16_t& out) {
        uint8_t b[2];
        if (!read_raw(offset, b, 2)) return false;
        out = little_ ? static_cast<uint16_t>(b[0] | (b[1] << 8))
                      : static_cast<uint16_t>((b[0] << 8) | b[1]);
        return true;
    }

    bool u32(uint32_t offset, uint32_t& out) {
        uint8_t b[4];
        if (!read_raw(offset, b, 4)) return false;
        if (little_) {
            out = static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
                  (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
        } else {
            out = (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
                  (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
        }
        return true;
    }

    bool read_raw(uint32_t offset, void* dst, size_t n) {
        in_.clear();
        in_.seekg(base_ + static_cast<std::streamoff>(offset));
        if (!in_) return false;
        in_.read(static_cast<char*>(dst), static_cast<std::streamsize>(n));
        return static_cast<size_t>(in_.gcount()) == n;
    }

private:
    std::istream& in_;
    std::streampos base_;
    bool little_ = true;
};

struct IfdEntry {
    uint16_t tag = 0;
    uint16_t type = 0;
    uint32_t count = 0;
    uint32_t value_offset = 0;  // byte offset of the 4-byte value field
};

std::vector<IfdEntry> read_ifd(TiffStream& ts, uint32_t offset) {
    std::vector<IfdEntry> entries;
    uint16_t count = 0;
    if (offset == 0 || !ts.u16(offset, count) || count > kMaxEntries) return entries;

    for (uint16_t i = 0; i < count; ++i) {
        const uint32_t pos = offset + 2 + 12u * i;
        IfdEntry e;
        if (!ts.u16(pos, e.tag) || !ts.u16(pos + 2, e.type) || !ts.u32(pos + 4, e.count)) {
            break;
        }
        e.value_offset = pos + 8;
        entries.push_back(e);
    }
    return entries;
}

std::optional<std::string> read_ascii(TiffStream& ts, const IfdEntry& e) {
    if (e.type != kTypeAscii || e.count == 0 || e.count > kMaxAsciiLength) return std::nullopt;

    uint32_t data_offset = e.value_offset;
    if (e.count > 4 && !ts.u32(e.value_offset, data_offset)) return std::nullopt;

    std::string value(e.count, '\0');
    if (!ts.read_raw(data_offset, value.data(), e.count)) return std::nullopt;

    const auto nul = value.find('\0');
    if (nul != std::string::npos) value.resize(nul);
    while (!value.empty() && value.back() == ' ') value.pop_back();
    if (value.empty()) return std::nullopt;
    return value;
}

// Locates the APP1 Exif payload and returns it as a byte string.
std::optional<std::string> find_jpeg_exif(std::istream& in) {
    uint8_t soi[2];
    in.read(reinterpret_cast<char*>(soi), 2);
    if (in.gcount() != 2 || soi[0] != 0xFF || soi[1] != 0xD8) return std::nullopt;

    while (in) {
        uint8_t marker[2];
        in.read(reinterpret_cast<char*>(marker), 2);
        if (in.gcount() != 2 || marker[0] != 0xFF) return std::nullopt;

        // start of scan or end of image: no metadata beyond this point
        if (marker[1] == 0xDA || marker[1] == 0xD9) return std::nullopt;
        if (marker[1] == 0x01 || (marker[1] >= 0xD0 && marker[1] <= 0xD7)) continue;

        uint8_t len_bytes[2];
        in.read(reinterpret_cast<char*>(len_bytes), 2);
        if (in.gcount() != 2) return std::nullopt;
        const uint16_t length = static_cast<uint16_t>((len_bytes[0] << 8) | len_bytes[1]);
        if (length < 2) return std::nullopt;

        std::string payload(length - 2u, '\0');
        in.read(payload.data(), static_cast<std::streamsize>(payload.size()));
        if (static_cast<size_t>(in.gcount()) != payload.size()) return std::nullopt;

        if (marker[1] == 0xE1 && payload.size() > 6 &&
            std::memcmp(payload.data(), "Exif\0\0", 6) == 0) {
            return payload.substr(6);
        }
    }
    return std::nullopt;
}

} // namespace

ExifDateTimes parse_tiff_datetimes(std::istream& in) {
    ExifDateTimes out;
    TiffStream ts(in);

    uint32_t ifd0 = 0;
    if (!ts.read_header(ifd0)) return out;

    uint32_t exif_ifd = 0;
    for (const auto& e : read_ifd(ts, ifd0)) {
        if (e.tag == kTagDateTime) {
            out.datetime = read_ascii(ts, e);
        } else if (e.tag == kTagExifIfd && e.type == kTypeLong) {
            ts.u32(e.value_offset, exif_ifd);
        }
    }

    if (exif_ifd != 0 && exif_ifd != ifd0) {
        for (const auto& e : read_ifd(ts, exif_ifd)) {
            if (e.tag == kTagDateTimeOriginal) {
                out.original = read_ascii(ts, e);
            } else if (e.tag == kTagDateTimeDigitized) {
                out.digitized = read_ascii(ts, e);
            }
        }
    }
    return out;
}

ExifDateTimes read_exif_datetimes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    char magic[2] = {0, 0};
    file.read(magic, 2);
    if (file.gcount() != 2) return {};
    file.clear();
    file.seekg(0);

    if ((magic[0] == 'I' && magic[1] == 'I') || (magic[0] == 'M' && magic[1] == 'M')) {
        return parse_tiff_datetimes(file);
    }

    if (static_cast<uint8_t>(magic[0]) == 0xFF && static_cast<uint8_t>(magic[1]) == 0xD8) {
        auto payload = find_jpeg_exif(file);
        if (!payload) return {};
        std::istringstream block(*payload);
        return parse_tiff_datetimes(block);
    }

    return {};
}

std::optional<SystemClock::time_point> parse_exif_datetime(const std::string& value) {
    std::tm tm{};
    std::istringstream iss(value);
    iss >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
    if (iss.fail()) return std::nullopt;

    // "0000:00:00 00:00:00" is what cameras write when the clock was never set
    if (tm.tm_year + 1900 < 1900 || tm.tm_mday == 0) return std::nullopt;

    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return SystemClock::from_time_t(t);
}

} // namespace slide_ingest::io
