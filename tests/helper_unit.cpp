// Unit coverage for small helpers: endian readers, fourcc and hex helpers, tick math and the
// segment plan.
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "cut_engine.hpp"
#include "logging.hpp"
#include "media_types.hpp"
#include "mp4_reader.hpp"
#include "segment_plan.hpp"
#include "timestamp_math.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_endian_readers() {
    std::istringstream s32(std::string("\x01\x02\x03\x04", 4));
    uint32_t v32 = read_u32(s32);
    bool ok = check(v32 == 0x01020304u, "read_u32 big-endian decode");

    std::istringstream s64(std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
    uint64_t v64 = read_u64(s64);
    ok &= check(v64 == 0x0102030405060708ULL, "read_u64 big-endian decode");

    std::vector<uint8_t> buf;
    write_u24(buf, 0x0A0B0C);
    write_u64(buf, 0x1122334455667788ULL);
    ok &= check(buf.size() == 11, "write_u24 + write_u64 emit 11 bytes");
    ok &= check(load_u64(buf.data() + 3) == 0x1122334455667788ULL, "load_u64 reads back");
    store_u32(buf, 0, 0xDEADBEEF);
    ok &= check(load_u32(buf.data()) == 0xDEADBEEF, "store_u32 patches in place");
    return ok;
}

bool test_hex_prefix() {
    using clipsplice::hex_prefix;
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd ff", "hex_prefix default prints all up to limit");
    return ok;
}

bool test_fourcc() {
    bool ok = check(fourcc('m', 'o', 'o', 'v') == 0x6D6F6F76u, "fourcc chars");
    ok &= check(fourcc(std::string("trak")) == fourcc('t', 'r', 'a', 'k'), "fourcc string");
    ok &= check(fourcc_to_string(fourcc('s', 't', 's', 'd')) == "stsd", "fourcc_to_string");
    ok &= check(is_printable_fourcc(fourcc('u', 'r', 'l', ' ')), "space is printable");
    ok &= check(!is_printable_fourcc(0x00000001u), "control bytes are not printable");

    bool threw = false;
    try {
        (void)fourcc(std::string("ab"));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    ok &= check(threw, "fourcc rejects short strings");
    return ok;
}

bool test_names() {
    using namespace clipsplice;
    bool ok = check(media_type_for_handler(fourcc('v', 'i', 'd', 'e')) == MediaType::Video,
                    "vide -> video");
    ok &= check(media_type_for_handler(fourcc('s', 'o', 'u', 'n')) == MediaType::Audio,
                "soun -> audio");
    ok &= check(media_type_for_handler(fourcc('s', 'b', 't', 'l')) == MediaType::Subtitle,
                "sbtl -> subtitle");
    ok &= check(media_type_for_handler(fourcc('h', 'i', 'n', 't')) == MediaType::Other,
                "unknown handler -> other");
    ok &= check(std::string(media_type_name(MediaType::Audio)) == "audio", "media_type_name");
    ok &= check(std::string(splice_error_name(SpliceError::FormatMismatch)) == "FormatMismatch",
                "splice_error_name");

    ok &= check(clip_name(0) == "clip_01", "clip_name first segment");
    ok &= check(clip_name(9) == "clip_10", "clip_name two digits");
    ok &= check(clip_name(122) == "clip_123", "clip_name widens past 99");

    OutOfRangePolicy policy = OutOfRangePolicy::Clamp;
    ok &= check(parse_out_of_range_policy("drop", policy) && policy == OutOfRangePolicy::Drop,
                "parse drop policy");
    ok &= check(parse_out_of_range_policy("fail", policy) && policy == OutOfRangePolicy::Fail,
                "parse fail policy");
    ok &= check(!parse_out_of_range_policy("ignore", policy) && policy == OutOfRangePolicy::Fail,
                "unknown policy rejected and left untouched");
    ok &= check(std::string(out_of_range_policy_name(OutOfRangePolicy::Clamp)) == "clamp",
                "policy name");
    return ok;
}

bool test_log_verbosity() {
    using namespace clipsplice;
    bool ok = check(parse_log_verbosity("debug") == LogVerbosity::Debug, "parse debug");
    ok &= check(parse_log_verbosity("warning") == LogVerbosity::Warn, "parse warning alias");
    ok &= check(parse_log_verbosity("bogus") == LogVerbosity::Error, "unknown maps to error");

    const auto saved = get_log_verbosity();
    set_log_verbosity(LogVerbosity::Warn);
    ok &= check(cs_should_log("error") && cs_should_log("warn"), "warn level passes error+warn");
    ok &= check(!cs_should_log("info") && !cs_should_log("reader"), "warn level hides info+debug");
    set_log_verbosity(saved);
    return ok;
}

bool test_tick_math() {
    using clipsplice::rescale_ticks;
    bool ok = check(rescale_ticks(4000, 1000, 48000) == 192000, "ms -> 48k exact");
    ok &= check(rescale_ticks(1, 3, 2) == 1, "2/3 rounds up");
    ok &= check(rescale_ticks(1, 4, 2) == 1, "half rounds up");
    ok &= check(rescale_ticks(1, 5, 2) == 0, "2/5 rounds down");
    ok &= check(rescale_ticks(77, 90000, 90000) == 77, "same timescale untouched");
    // Large values must not overflow the intermediate product.
    const uint64_t big = 0x7FFFFFFFFFFFull * 90000;
    ok &= check(rescale_ticks(big, 90000, 1000) == 0x7FFFFFFFFFFFull * 1000,
                "large value rescales without overflow");

    uint64_t out = 0;
    ok &= check(!clipsplice::checked_mul(std::numeric_limits<uint64_t>::max(), 2, out),
                "checked_mul reports overflow");
    ok &= check(clipsplice::checked_add(1, 2, out) && out == 3, "checked_add");

    ok &= check(clipsplice::rescale_ticks_up(1, 5, 2) == 1, "2/5 rounds up");
    ok &= check(clipsplice::rescale_ticks_up(40, 1000, 48000) == 1920, "exact stays exact");

    // A -1001 offset at 30000 and a -20 ms offset at 48 kHz share the larger movie lead.
    std::vector<clipsplice::TrackDescriptor> tracks(2);
    tracks[0].timescale = 30000;
    tracks[0].min_composition_offset = -1001;
    tracks[1].timescale = 48000;
    tracks[1].min_composition_offset = -960;
    const auto deficit = clipsplice::composition_deficit(tracks);
    ok &= check(deficit.size() == 2 && deficit[0] == 1001 && deficit[1] == 960,
                "deficit from negative offsets");
    const auto lead = clipsplice::composition_lead(tracks, deficit, 1000);
    ok &= check(lead.size() == 2 && lead[0] == 1020 && lead[1] == 1632,
                "34 ms lead in each timescale");
    const auto none = clipsplice::composition_lead(tracks, {0, 0}, 1000);
    ok &= check(none.size() == 2 && none[0] == 0 && none[1] == 0, "no lead without deficit");
    return ok;
}

bool test_segment_plan() {
    using namespace clipsplice;
    SegmentPlan plan;

    // 20 s at 1000 ticks/s in 8 s pieces.
    bool ok = check(SegmentPlan::create(8.0, 20000, 1000, plan).ok, "plan 20s/8s");
    ok &= check(plan.segment_count() == 3, "20s/8s -> 3 segments");
    ok &= check(plan.segment_us() == 8000000, "segment length in microseconds");

    int64_t index = -1;
    ok &= check(plan.segment_index(0, 48000, index) && index == 0, "dts 0 in segment 0");
    ok &= check(plan.segment_index(383999, 48000, index) && index == 0,
                "last tick before 8s stays in segment 0");
    ok &= check(plan.segment_index(384000, 48000, index) && index == 1,
                "dts exactly 8s opens segment 1");
    ok &= check(plan.segment_index(-1, 48000, index) && index == -1, "negative dts floors to -1");
    ok &= check(plan.segment_index(30 * 48000, 48000, index) && index == 3,
                "dts past the end maps beyond the last segment");

    int64_t start = -1;
    ok &= check(plan.segment_start(2, 90000, start) && start == 16 * 90000, "segment 2 start");

    // Exact multiple: no trailing empty segment.
    ok &= check(SegmentPlan::create(5.0, 20000, 1000, plan).ok && plan.segment_count() == 4,
                "20s/5s -> 4 segments");
    // Longer than the source.
    ok &= check(SegmentPlan::create(60.0, 20000, 1000, plan).ok && plan.segment_count() == 1,
                "segment longer than source -> 1 segment");
    // Fractional lengths round to microseconds.
    ok &= check(SegmentPlan::create(0.5, 1001, 1000, plan).ok && plan.segment_count() == 3,
                "1.001s/0.5s -> 3 segments");

    ok &= check(SegmentPlan::create(0.0, 20000, 1000, plan).error == SpliceError::InvalidArgument,
                "zero length rejected");
    ok &= check(SegmentPlan::create(-3.0, 20000, 1000, plan).error == SpliceError::InvalidArgument,
                "negative length rejected");
    ok &= check(SegmentPlan::create(std::nan(""), 20000, 1000, plan).error ==
                    SpliceError::InvalidArgument,
                "NaN length rejected");
    ok &= check(SegmentPlan::create(1e-9, 20000, 1000, plan).error ==
                    SpliceError::InvalidArgument,
                "sub-microsecond length rejected");
    ok &= check(SegmentPlan::create(8.0, 0, 1000, plan).error == SpliceError::InvalidDuration,
                "zero duration rejected");
    ok &= check(SegmentPlan::create(8.0, std::numeric_limits<uint64_t>::max(), 1000, plan).error ==
                    SpliceError::InvalidDuration,
                "unrepresentable duration rejected");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_endian_readers();
    ok &= test_hex_prefix();
    ok &= test_fourcc();
    ok &= test_names();
    ok &= test_log_verbosity();
    ok &= test_tick_math();
    ok &= test_segment_plan();
    if (!ok) {
        return 1;
    }
    std::cout << "[helper_unit] all checks passed\n";
    return 0;
}
