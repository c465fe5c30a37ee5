//
//  mp4_reader.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mp4_reader.hpp"

#include <algorithm>
#include <chrono>
#include <streambuf>
#include <string>
#include <utility>

#include "byte_io.hpp"
#include "logging.hpp"
#include "timestamp_math.hpp"

namespace {

using clipsplice::rescale_ticks;
using reader_detail::TrackParseResult;

constexpr uint64_t kAtomHeaderSize = 8;
constexpr uint64_t kMaxAtomPayload = 512 * 1024 * 1024;  // 512 MB safety bound for copied boxes
constexpr uint64_t kMvhdMinPayloadV0 = 20;
constexpr uint64_t kMvhdMinPayloadV1 = 32;
constexpr uint64_t kTkhdPayloadV0 = 84;
constexpr uint64_t kTkhdPayloadV1 = 96;
constexpr uint64_t kMdhdMinPayloadV0 = 22;
constexpr uint64_t kMdhdMinPayloadV1 = 34;
constexpr uint64_t kHdlrMinPayload = 24;

// Read-only streambuf over the in-memory file so the box walkers can seek as on a file.
class MemoryStreamBuf : public std::streambuf {
   public:
    MemoryStreamBuf(const uint8_t *data, size_t size) {
        char *begin = const_cast<char *>(reinterpret_cast<const char *>(data));
        setg(begin, begin, begin + size);
    }

   protected:
    pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                     std::ios_base::openmode /*which*/) override {
        off_type base = 0;
        if (dir == std::ios_base::cur) {
            base = gptr() - eback();
        } else if (dir == std::ios_base::end) {
            base = egptr() - eback();
        }
        const off_type target = base + off;
        if (target < 0 || target > egptr() - eback()) {
            return pos_type(off_type(-1));
        }
        setg(eback(), eback() + target, egptr());
        return pos_type(target);
    }

    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }
};

}  // namespace

static void skip(std::istream &in, uint64_t n) { in.seekg(static_cast<std::streamoff>(n), std::ios::cur); }

static uint64_t position(std::istream &in) {
    const auto pos = in.tellg();
    return pos < 0 ? 0 : static_cast<uint64_t>(pos);
}

uint32_t read_u32(std::istream &in) {
    uint8_t b[4] = {};
    in.read(reinterpret_cast<char *>(b), 4);
    return load_u32(b);
}

uint64_t read_u64(std::istream &in) {
    uint8_t b[8] = {};
    in.read(reinterpret_cast<char *>(b), 8);
    return load_u64(b);
}

// Read atom header: size + type (+ largesize). A zero size field means "up to parent_end".
static Mp4AtomInfo read_atom_header(std::istream &in, uint64_t parent_end) {
    Mp4AtomInfo info;
    info.offset = position(in);
    const uint32_t size32 = read_u32(in);
    info.type = read_u32(in);
    if (!in) {
        info.size = 0;
        return info;
    }

    if (size32 == 1) {
        // 64-bit extended size.
        info.size = read_u64(in);
        info.header_size = 16;
    } else if (size32 == 0) {
        info.size = parent_end > info.offset ? parent_end - info.offset : 0;
    } else {
        info.size = size32;
    }
    if (!in || info.size < info.header_size) {
        CS_LOG("debug", "atom " << fourcc_to_string(info.type) << " @" << info.offset
                                << " has unusable size " << info.size);
        info.size = 0;
    }
    return info;
}

// Utility: read an atom payload into a byte buffer.
static std::vector<uint8_t> read_bytes(std::istream &in, uint64_t size) {
    if (size > kMaxAtomPayload) {
        CS_LOG("warn", "box payload of " << size << " bytes exceeds safety bound, skipping");
        skip(in, size);
        return {};
    }
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(size));
    if (static_cast<uint64_t>(in.gcount()) != size) {
        return {};
    }
    return buf;
}

// Visit each child box between the current position and `end`. Children that claim to run
// past their parent are clamped. Returns false when a header is unusable or `fn` rejects a
// child; the stream is left at the end of the last visited child.
template <typename Fn>
static bool walk_children(std::istream &in, uint64_t end, const char *parent, Fn &&fn) {
    while (in && position(in) + kAtomHeaderSize <= end) {
        auto child = read_atom_header(in, end);
        if (child.size == 0) {
            CS_LOG("debug", parent << " child header unusable, stopping");
            return false;
        }
        if (child.offset + child.size > end) {
            CS_LOG("debug", parent << " child " << fourcc_to_string(child.type) << " claims size "
                                   << child.size << " past parent end " << end << "; clamping");
            child.size = end - child.offset;
            if (child.size < child.header_size) {
                return false;
            }
        }
        if (!fn(child, child.size - child.header_size)) {
            return false;
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(child.offset + child.size));
    }
    return true;
}

// Parse mvhd to get the movie timescale + duration.
static bool parse_mvhd(std::istream &in, uint64_t size, clipsplice::ContainerInfo &info) {
    const auto box = read_bytes(in, size);
    if (box.size() < kMvhdMinPayloadV0) {
        return false;
    }
    if (box[0] == 1) {
        if (box.size() < kMvhdMinPayloadV1) {
            return false;
        }
        info.timescale = load_u32(&box[20]);
        info.duration = load_u64(&box[24]);
    } else {
        info.timescale = load_u32(&box[12]);
        info.duration = load_u32(&box[16]);
    }
    return true;
}

// Parse tkhd to retrieve track id, flags and presentation fields.
static bool parse_tkhd(std::istream &in, uint64_t size, clipsplice::TrackDescriptor &track) {
    const auto box = read_bytes(in, size);
    if (box.empty()) {
        return false;
    }
    const bool v1 = box[0] == 1;
    if (box.size() < (v1 ? kTkhdPayloadV1 : kTkhdPayloadV0)) {
        CS_LOG("debug", "tkhd too small: " << box.size());
        return false;
    }
    track.tkhd_flags = (uint32_t(box[1]) << 16) | (uint32_t(box[2]) << 8) | box[3];

    // creation + modification time are 4 or 8 bytes each; duration follows track_ID + reserved.
    const size_t id_pos = v1 ? 20 : 12;
    track.track_id = load_u32(&box[id_pos]);

    const size_t tail = v1 ? 44 : 32;  // layer
    track.layer = load_u16(&box[tail]);
    track.alternate_group = load_u16(&box[tail + 2]);
    track.volume = load_u16(&box[tail + 4]);
    for (size_t i = 0; i < track.matrix.size(); ++i) {
        track.matrix[i] = load_u32(&box[tail + 8 + i * 4]);
    }
    track.width = load_u32(&box[tail + 44]);
    track.height = load_u32(&box[tail + 48]);
    return true;
}

// Parse mdhd to get timescale + duration + language.
static bool parse_mdhd(std::istream &in, uint64_t size, clipsplice::TrackDescriptor &track) {
    const auto box = read_bytes(in, size);
    if (box.size() < kMdhdMinPayloadV0) {
        return false;
    }
    if (box[0] == 1) {
        if (box.size() < kMdhdMinPayloadV1) {
            return false;
        }
        track.timescale = load_u32(&box[20]);
        track.duration = load_u64(&box[24]);
        track.language = load_u16(&box[32]);
    } else {
        track.timescale = load_u32(&box[12]);
        track.duration = load_u32(&box[16]);
        track.language = load_u16(&box[20]);
    }
    return true;
}

// Parse hdlr to retrieve handler type and name.
static void parse_hdlr(std::istream &in, uint64_t size, clipsplice::TrackDescriptor &track) {
    const auto box = read_bytes(in, size);
    if (box.size() < kHdlrMinPayload) {
        return;
    }
    // version/flags, pre_defined, handler_type, reserved[3], then the name.
    track.handler_type = load_u32(&box[8]);
    track.media_type = clipsplice::media_type_for_handler(track.handler_type);

    std::string name(box.begin() + kHdlrMinPayload, box.end());
    // QuickTime writes a Pascal string; ISO writers a null-terminated one.
    if (!name.empty() && static_cast<uint8_t>(name[0]) == name.size() - 1) {
        name.erase(0, 1);
    }
    while (!name.empty() && name.back() == '\0') {
        name.pop_back();
    }
    track.handler_name = std::move(name);
}

// Parse elst; only a leading empty edit (media_time -1) is honored, as the start offset of
// the first sample. A media edit that starts inside the media is reported and dropped.
static void parse_elst(std::istream &in, uint64_t size, TrackParseResult &track) {
    const auto box = read_bytes(in, size);
    if (box.size() < 8) {
        return;
    }
    const bool v1 = box[0] == 1;
    const size_t entry_size = v1 ? 20 : 12;
    const uint32_t entries = load_u32(&box[4]);
    for (uint32_t i = 0; i < entries; ++i) {
        const size_t at = 8 + static_cast<size_t>(i) * entry_size;
        if (at + entry_size > box.size()) {
            CS_LOG("warn", "elst truncated after " << i << " of " << entries << " entries");
            return;
        }
        const uint64_t segment_duration = v1 ? load_u64(&box[at]) : load_u32(&box[at]);
        const int64_t media_time = v1 ? static_cast<int64_t>(load_u64(&box[at + 8]))
                                      : static_cast<int32_t>(load_u32(&box[at + 4]));
        if (media_time == -1) {
            if (i == 0) {
                track.empty_edit = segment_duration;
            }
            continue;
        }
        if (media_time > 0) {
            track.skipped_media_time = media_time;
            CS_LOG("warn", "elst media edit starts at media time "
                               << media_time << "; presentation offset not applied");
        }
        if (i + 1 < entries) {
            CS_LOG("warn", "elst has " << entries << " entries; edits after entry " << (i + 1)
                                       << " ignored");
        }
        return;
    }
}

// Parse stbl children (stsd, stts, ctts, stss, stsz, stsc, stco/co64).
static bool parse_stbl(std::istream &in, uint64_t end, TrackParseResult &track) {
    auto &tables = track.tables;
    return walk_children(in, end, "stbl", [&](const Mp4AtomInfo &box, uint64_t payload) {
        switch (box.type) {
            case fourcc('s', 't', 's', 'd'):
                track.descriptor.codec_config = read_bytes(in, payload);
                break;
            case fourcc('s', 't', 't', 's'):
                tables.stts = read_bytes(in, payload);
                break;
            case fourcc('c', 't', 't', 's'):
                tables.ctts = read_bytes(in, payload);
                break;
            case fourcc('s', 't', 's', 's'):
                tables.stss = read_bytes(in, payload);
                break;
            case fourcc('s', 't', 's', 'z'):
                tables.stsz = read_bytes(in, payload);
                break;
            case fourcc('s', 't', 's', 'c'):
                tables.stsc = read_bytes(in, payload);
                break;
            case fourcc('s', 't', 'c', 'o'):
                tables.stco = read_bytes(in, payload);
                tables.co64 = false;
                break;
            case fourcc('c', 'o', '6', '4'):
                tables.stco = read_bytes(in, payload);
                tables.co64 = true;
                break;
            default:
                CS_LOG("debug", "  stbl skip " << fourcc_to_string(box.type));
                break;
        }
        return true;
    });
}

// Parse mdia box of a track.
static bool parse_mdia(std::istream &in, uint64_t end, TrackParseResult &track) {
    return walk_children(in, end, "mdia", [&](const Mp4AtomInfo &box, uint64_t payload) {
        switch (box.type) {
            case fourcc('m', 'd', 'h', 'd'):
                if (!parse_mdhd(in, payload, track.descriptor)) {
                    CS_LOG("debug", "  mdhd unreadable");
                    return false;
                }
                CS_LOG("debug", "  mdhd timescale=" << track.descriptor.timescale
                                                    << " duration=" << track.descriptor.duration);
                return true;
            case fourcc('h', 'd', 'l', 'r'):
                parse_hdlr(in, payload, track.descriptor);
                CS_LOG("debug", "  hdlr=" << fourcc_to_string(track.descriptor.handler_type)
                                          << " name=" << track.descriptor.handler_name);
                return true;
            case fourcc('m', 'i', 'n', 'f'):
                return walk_children(in, box.offset + box.size, "minf",
                                     [&](const Mp4AtomInfo &child, uint64_t) {
                                         if (child.type == fourcc('s', 't', 'b', 'l')) {
                                             return parse_stbl(in, child.offset + child.size,
                                                               track);
                                         }
                                         return true;
                                     });
            default:
                return true;
        }
    });
}

// Parse trak box. Returns nullopt when the box tree is malformed.
static std::optional<TrackParseResult> parse_trak(std::istream &in, uint64_t payload_size) {
    const uint64_t trak_end = position(in) + payload_size;
    TrackParseResult track;
    CS_LOG("debug", "trak start end=" << trak_end);

    const bool ok = walk_children(in, trak_end, "trak", [&](const Mp4AtomInfo &box, uint64_t payload) {
        CS_LOG("debug", " trak child=" << fourcc_to_string(box.type) << " size=" << box.size);
        if (box.type == fourcc('t', 'k', 'h', 'd')) {
            return parse_tkhd(in, payload, track.descriptor);
        }
        if (box.type == fourcc('m', 'd', 'i', 'a')) {
            return parse_mdia(in, box.offset + box.size, track);
        }
        if (box.type == fourcc('e', 'd', 't', 's')) {
            return walk_children(in, box.offset + box.size, "edts",
                                 [&](const Mp4AtomInfo &child, uint64_t child_payload) {
                                     if (child.type == fourcc('e', 'l', 's', 't')) {
                                         parse_elst(in, child_payload, track);
                                     }
                                     return true;
                                 });
        }
        // tref and udta are not carried.
        return true;
    });
    in.clear();
    in.seekg(static_cast<std::streamoff>(trak_end));
    if (!ok) {
        return std::nullopt;
    }
    return track;
}

// Parse moov atom.
static void parse_moov(std::istream &in, const Mp4AtomInfo &atom, clipsplice::ContainerInfo &info,
                       std::vector<TrackParseResult> &tracks, bool &fragmented) {
    const uint64_t end = atom.offset + atom.size;
    CS_LOG("debug", "enter moov @0x" << std::hex << atom.offset << std::dec << " end=" << end);

    walk_children(in, end, "moov", [&](const Mp4AtomInfo &child, uint64_t payload) {
        CS_LOG("debug", "moov child=" << fourcc_to_string(child.type) << " size=" << child.size
                                      << " offset=0x" << std::hex << child.offset << std::dec);
        switch (child.type) {
            case fourcc('m', 'v', 'h', 'd'):
                if (!parse_mvhd(in, payload, info)) {
                    CS_LOG("warn", "mvhd unreadable");
                }
                break;
            case fourcc('t', 'r', 'a', 'k'): {
                auto track = parse_trak(in, payload);
                if (track) {
                    tracks.push_back(std::move(*track));
                } else {
                    CS_LOG("warn", "skipping malformed trak @" << child.offset);
                }
                break;
            }
            case fourcc('m', 'v', 'e', 'x'):
                fragmented = true;
                break;
            default:
                break;
        }
        return true;
    });
}

namespace clipsplice {

bool Mp4Reader::open(std::vector<uint8_t> bytes) {
    const auto t_start = std::chrono::steady_clock::now();
    data_ = std::move(bytes);
    info_ = ContainerInfo{};
    tables_.clear();

    const uint64_t file_size = data_.size();
    CS_LOG("debug", "mp4 open size=" << file_size);
    MemoryStreamBuf buf(data_.data(), data_.size());
    std::istream in(&buf);

    bool have_moov = false;
    bool fragmented = false;
    std::vector<TrackParseResult> parsed;

    while (position(in) + kAtomHeaderSize <= file_size) {
        Mp4AtomInfo atom = read_atom_header(in, file_size);
        if (atom.size == 0) {
            CS_LOG("warn", "mp4 open: atom with zero/invalid size encountered, bailing");
            break;
        }
        if (atom.offset + atom.size > file_size) {
            if (atom.type != fourcc('m', 'd', 'a', 't')) {
                CS_LOG("error", "mp4 open: bad atom header type=" << fourcc_to_string(atom.type)
                                                                  << " size=" << atom.size
                                                                  << " offset=" << atom.offset
                                                                  << " file=" << file_size);
                break;
            }
            // Truncated mdat: samples beyond the end are caught when they are read.
            CS_LOG("warn", "mp4 open: mdat truncated by " << (atom.offset + atom.size - file_size)
                                                          << " bytes");
            atom.size = file_size - atom.offset;
        }

        switch (atom.type) {
            case fourcc('m', 'o', 'o', 'v'):
                if (have_moov) {
                    CS_LOG("warn", "mp4 open: ignoring second moov @" << atom.offset);
                    break;
                }
                have_moov = true;
                parse_moov(in, atom, info_, parsed, fragmented);
                break;
            case fourcc('m', 'o', 'o', 'f'):
                fragmented = true;
                break;
            default:
                // ftyp, mdat, free, skip, uuid ...: nothing to read up front.
                break;
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(atom.offset + atom.size));
    }

    if (!have_moov) {
        CS_LOG("error", "mp4 open: no moov box found");
        return false;
    }
    if (fragmented) {
        CS_LOG("error", "mp4 open: fragmented MP4 (moof/mvex) is not supported");
        return false;
    }
    if (info_.timescale == 0) {
        CS_LOG("error", "mp4 open: missing or zero mvhd timescale");
        return false;
    }

    // Replacement ids start above every id in the file, so they never meet a later track.
    uint32_t highest_id = 0;
    for (const auto &track : parsed) {
        highest_id = std::max(highest_id, track.descriptor.track_id);
    }
    const auto id_in_use = [&](uint32_t id) {
        return std::any_of(parsed.begin(), parsed.end(), [&](const TrackParseResult &t) {
            return t.descriptor.track_id == id;
        });
    };
    uint32_t next_free_id = highest_id;

    for (auto &track : parsed) {
        auto &desc = track.descriptor;
        std::string why;
        uint64_t sample_count = 0;
        if (desc.timescale == 0) {
            CS_LOG("warn", "skipping track " << desc.track_id << ": zero media timescale");
            continue;
        }
        if (desc.codec_config.empty()) {
            CS_LOG("warn", "skipping track " << desc.track_id << ": no stsd");
            continue;
        }
        if (!validate_sample_tables(track.tables, sample_count, why)) {
            CS_LOG("warn", "skipping track " << desc.track_id << ": " << why);
            continue;
        }
        const bool duplicate =
            std::any_of(info_.tracks.begin(), info_.tracks.end(),
                        [&](const TrackDescriptor &t) { return t.track_id == desc.track_id; });
        if (desc.track_id == 0 || duplicate) {
            do {
                next_free_id = next_free_id == UINT32_MAX ? 1 : next_free_id + 1;
            } while (id_in_use(next_free_id));
            const uint32_t replacement = next_free_id;
            CS_LOG("warn", "track id " << desc.track_id << " unusable, renumbering to "
                                       << replacement);
            desc.track_id = replacement;
        }
        desc.sample_count = sample_count;
        desc.min_composition_offset = min_composition_offset(track.tables);
        track.tables.first_dts = static_cast<int64_t>(
            rescale_ticks(track.empty_edit, info_.timescale, desc.timescale));
        CS_LOG("debug", "track " << desc.track_id << " " << media_type_name(desc.media_type)
                                 << " timescale=" << desc.timescale
                                 << " duration=" << desc.duration << " samples=" << sample_count
                                 << " stsd_bytes=" << desc.codec_config.size()
                                 << " stsd_hex=" << hex_prefix(desc.codec_config));
        info_.tracks.push_back(std::move(desc));
        tables_.push_back(std::move(track.tables));
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t_start)
                        .count();
    CS_LOG("debug", "mp4 open done timescale=" << info_.timescale << " duration=" << info_.duration
                                               << " tracks=" << info_.tracks.size()
                                               << " timings_ms total=" << ms);
    return true;
}

std::unique_ptr<SampleSequence> Mp4Reader::samples(uint32_t track_id) {
    for (size_t i = 0; i < info_.tracks.size(); ++i) {
        if (info_.tracks[i].track_id == track_id) {
            return std::make_unique<Mp4SampleSequence>(data_, tables_[i]);
        }
    }
    return nullptr;
}

}  // namespace clipsplice

#ifdef CLIPSPLICE_TESTING
std::optional<TrackParseResult> parse_trak_for_test(std::istream &in, uint64_t payload_size) {
    return parse_trak(in, payload_size);
}
#endif
