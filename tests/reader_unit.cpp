// Reader coverage on synthesized files: track metadata, sample tables (ctts, stss, stsc runs,
// co64), edit lists and direct trak parsing.
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "mp4_fixture.hpp"
#include "mp4_reader.hpp"

namespace {

using namespace mp4_fixture;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[reader_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<clipsplice::SampleRecord> drain(clipsplice::ContainerReader &reader, uint32_t track_id,
                                            bool &failed) {
    std::vector<clipsplice::SampleRecord> out;
    auto seq = reader.samples(track_id);
    if (!seq) {
        failed = true;
        return out;
    }
    while (const auto *s = seq->next()) {
        out.push_back(*s);
    }
    failed = seq->failed();
    return out;
}

bool test_track_metadata() {
    Track video = uniform_track('vide', 90000, 30, 3000, 100, 10, 3);
    Track audio = uniform_track('soun', 48000, 47, 1024, 20, 1, 5);
    auto file = build_mp4({video, audio});

    clipsplice::Mp4Reader reader;
    bool ok = check(reader.open(file), "open two-track file");
    if (!ok) {
        return false;
    }
    const auto &info = reader.info();
    ok &= check(info.timescale == 1000, "movie timescale");
    ok &= check(info.duration == 1002, "movie duration is the longest track (47*1024/48k)");
    ok &= check(info.tracks.size() == 2, "two tracks");
    if (info.tracks.size() != 2) {
        return false;
    }
    const auto &v = info.tracks[0];
    const auto &a = info.tracks[1];
    ok &= check(v.track_id == 1 && a.track_id == 2, "track ids");
    ok &= check(v.media_type == clipsplice::MediaType::Video, "video media type");
    ok &= check(a.media_type == clipsplice::MediaType::Audio, "audio media type");
    ok &= check(v.timescale == 90000 && a.timescale == 48000, "media timescales");
    ok &= check(v.duration == 90000, "video media duration");
    ok &= check(v.sample_count == 30 && a.sample_count == 47, "sample counts");
    ok &= check(v.codec_config == video.stsd, "video stsd kept verbatim");
    ok &= check(a.codec_config == audio.stsd, "audio stsd kept verbatim");
    ok &= check(v.handler_name == "Fixture", "handler name");
    ok &= check(v.language == 0x55C4, "language");
    ok &= check(v.width == (640u << 16) && v.height == (360u << 16), "tkhd dimensions");
    ok &= check(a.volume == 0x0100, "tkhd audio volume");
    return ok;
}

bool test_sample_walk() {
    Track video = uniform_track('vide', 1000, 25, 40, 0, 5, 9);
    for (size_t i = 0; i < video.samples.size(); ++i) {
        video.samples[i].size = static_cast<uint32_t>(10 + i);  // variable sizes
        video.samples[i].cts_offset = (i % 3 == 0) ? 80 : 0;
    }
    video.samples_per_chunk = 4;  // last chunk partially filled
    auto file = build_mp4({video});

    clipsplice::Mp4Reader reader;
    if (!check(reader.open(file), "open ctts/stss file")) {
        return false;
    }
    bool failed = false;
    auto samples = drain(reader, reader.info().tracks[0].track_id, failed);
    bool ok = check(!failed, "walk finishes cleanly");
    ok &= check(samples.size() == 25, "all samples delivered");
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto &s = samples[i];
        const int64_t dts = static_cast<int64_t>(i) * 40;
        ok &= check(s.dts == dts, "dts of sample " + std::to_string(i));
        ok &= check(s.cts == dts + ((i % 3 == 0) ? 80 : 0), "cts of sample " + std::to_string(i));
        ok &= check(s.duration == 40, "duration of sample " + std::to_string(i));
        ok &= check(s.is_sync == (i % 5 == 0), "sync flag of sample " + std::to_string(i));
        ok &= check(s.size == 10 + i && s.payload == sample_payload(9, i, s.size),
                    "payload of sample " + std::to_string(i));
    }
    ok &= check(reader.samples(77) == nullptr, "unknown track id yields no sequence");
    return ok;
}

bool test_negative_ctts() {
    Track video = uniform_track('vide', 1000, 6, 40, 8);
    video.samples[1].cts_offset = -40;
    video.samples[2].cts_offset = 40;
    auto file = build_mp4({video});

    clipsplice::Mp4Reader reader;
    if (!check(reader.open(file), "open ctts v1 file")) {
        return false;
    }
    bool failed = false;
    auto samples = drain(reader, 1, failed);
    bool ok = check(!failed && samples.size() == 6, "walk ctts v1 file");
    if (samples.size() == 6) {
        ok &= check(samples[1].cts == 0, "negative composition offset");
        ok &= check(samples[2].cts == 120, "positive composition offset");
    }
    return ok;
}

bool test_co64_and_largesize() {
    Track video = uniform_track('vide', 1000, 12, 40, 16, 1, 4);
    Options opt;
    opt.co64 = true;
    opt.largesize_mdat = true;
    auto file = build_mp4({video}, opt);

    clipsplice::Mp4Reader reader;
    if (!check(reader.open(file), "open co64/largesize file")) {
        return false;
    }
    bool failed = false;
    auto samples = drain(reader, 1, failed);
    bool ok = check(!failed && samples.size() == 12, "co64 walk delivers every sample");
    for (size_t i = 0; i < samples.size(); ++i) {
        ok &= check(samples[i].payload == sample_payload(4, i, 16),
                    "co64 payload " + std::to_string(i));
    }
    return ok;
}

bool test_empty_edit() {
    Track audio = uniform_track('soun', 48000, 10, 1024, 4);
    audio.empty_edit = 500;  // movie ticks
    auto file = build_mp4({audio});

    clipsplice::Mp4Reader reader;
    if (!check(reader.open(file), "open file with empty edit")) {
        return false;
    }
    bool failed = false;
    auto samples = drain(reader, 1, failed);
    bool ok = check(samples.size() == 10, "samples after empty edit");
    if (!samples.empty()) {
        ok &= check(samples.front().dts == 24000, "empty edit shifts the first dts");
        ok &= check(samples.back().dts == 24000 + 9 * 1024, "later samples follow");
    }
    return ok;
}

bool test_track_skipping() {
    auto file = build_mp4({uniform_track('vide', 1000, 5, 40, 8),
                           uniform_track('soun', 48000, 5, 1024, 8)});
    // Zero the second track's mdhd timescale.
    auto mdhd = find_box(file, {'moov', 'trak', 'mdia', 'mdhd'}, 1);
    if (!check(mdhd.has_value(), "fixture has a second mdhd")) {
        return false;
    }
    const size_t timescale_pos = mdhd->offset + mdhd->header + 12;
    file[timescale_pos] = file[timescale_pos + 1] = file[timescale_pos + 2] =
        file[timescale_pos + 3] = 0;

    clipsplice::Mp4Reader reader;
    bool ok = check(reader.open(file), "open succeeds with one unusable track");
    const auto &tracks = reader.info().tracks;
    ok &= check(tracks.size() == 1, "zero-timescale track skipped");
    ok &= check(!tracks.empty() && tracks.front().media_type == clipsplice::MediaType::Video,
                "usable track kept");
    return ok;
}

bool test_duplicate_track_ids() {
    auto file = build_mp4({uniform_track('vide', 1000, 5, 40, 8),
                           uniform_track('soun', 48000, 5, 1024, 8)});
    // Give the second tkhd the first track's id.
    auto tkhd = find_box(file, {'moov', 'trak', 'tkhd'}, 1);
    if (!check(tkhd.has_value(), "fixture has a second tkhd")) {
        return false;
    }
    const size_t id_pos = tkhd->offset + tkhd->header + 12;
    file[id_pos + 3] = 1;

    clipsplice::Mp4Reader reader;
    bool ok = check(reader.open(file), "open with duplicate track ids");
    const auto &tracks = reader.info().tracks;
    ok &= check(tracks.size() == 2 && tracks[0].track_id != tracks[1].track_id,
                "duplicate id renumbered");
    if (tracks.size() == 2) {
        bool failed = false;
        auto samples = drain(reader, tracks[1].track_id, failed);
        ok &= check(!failed && samples.size() == 5, "renumbered track still readable");
    }
    return ok;
}

bool test_renumbering_avoids_later_ids() {
    auto file = build_mp4({uniform_track('vide', 1000, 5, 40, 8),
                           uniform_track('soun', 48000, 6, 1024, 8),
                           uniform_track('vide', 1000, 7, 40, 8)});
    auto second = find_box(file, {'moov', 'trak', 'tkhd'}, 1);
    auto third = find_box(file, {'moov', 'trak', 'tkhd'}, 2);
    if (!check(second.has_value() && third.has_value(), "fixture has three tkhd boxes")) {
        return false;
    }
    // Ids 1, 1, 1001: the duplicate must not take 1001.
    file[second->offset + second->header + 12 + 3] = 1;
    const size_t third_id = third->offset + third->header + 12;
    file[third_id + 2] = 0x03;
    file[third_id + 3] = 0xE9;

    clipsplice::Mp4Reader reader;
    bool ok = check(reader.open(file), "open with ids 1, 1, 1001");
    const auto &tracks = reader.info().tracks;
    if (!check(tracks.size() == 3, "all three tracks kept")) {
        return false;
    }
    ok &= check(tracks[0].track_id == 1 && tracks[2].track_id == 1001, "unique ids kept");
    ok &= check(tracks[1].track_id == 1002, "duplicate renumbered above the highest id");
    const size_t expected[] = {5, 6, 7};
    for (size_t i = 0; i < tracks.size(); ++i) {
        bool failed = false;
        auto samples = drain(reader, tracks[i].track_id, failed);
        ok &= check(!failed && samples.size() == expected[i],
                    "track " + std::to_string(tracks[i].track_id) + " has its own samples");
    }
    return ok;
}

bool test_media_edit_offset_reported() {
    Track video = uniform_track('vide', 1000, 8, 40, 12);
    video.empty_edit = 100;
    auto file = build_mp4({video});
    auto elst = find_box(file, {'moov', 'trak', 'edts', 'elst'});
    if (!check(elst.has_value(), "fixture elst found")) {
        return false;
    }
    // Second entry's media_time: full box, entry count, first entry, segment duration.
    file[elst->offset + elst->header + 24 + 3] = 80;

    auto trak = find_payload(file, {'moov', 'trak'});
    if (!check(trak.has_value(), "fixture trak found")) {
        return false;
    }
    std::istringstream in(std::string(trak->begin(), trak->end()));
    auto parsed = parse_trak_for_test(in, trak->size());
    bool ok = check(parsed.has_value(), "trak with a media edit parses");
    if (parsed) {
        ok &= check(parsed->empty_edit == 100, "leading empty edit still honored");
        ok &= check(parsed->skipped_media_time == 80, "media edit start reported");
    }

    clipsplice::Mp4Reader reader;
    ok &= check(reader.open(file) && reader.info().tracks.size() == 1, "file still opens");
    if (reader.info().tracks.size() == 1) {
        bool failed = false;
        auto samples = drain(reader, reader.info().tracks[0].track_id, failed);
        ok &= check(!failed && !samples.empty() && samples[0].dts == 100,
                    "first sample placed by the empty edit only");
    }
    return ok;
}

bool test_rejections() {
    bool ok = true;
    {
        clipsplice::Mp4Reader reader;
        ok &= check(!reader.open({}), "empty input rejected");
    }
    {
        std::vector<uint8_t> junk;
        append_atom(junk, 'ftyp', {'i', 's', 'o', 'm', 0, 0, 0, 0});
        append_atom(junk, 'mdat', std::vector<uint8_t>(64, 0xAA));
        clipsplice::Mp4Reader reader;
        ok &= check(!reader.open(junk), "file without moov rejected");
    }
    {
        Options opt;
        opt.fragmented = true;
        auto file = build_mp4({uniform_track('vide', 1000, 5, 40, 8)}, opt);
        clipsplice::Mp4Reader reader;
        ok &= check(!reader.open(file), "mvex marks a fragmented file");
    }
    {
        auto file = build_mp4({uniform_track('vide', 1000, 5, 40, 8)});
        append_atom(file, 'moof', std::vector<uint8_t>(16, 0));
        clipsplice::Mp4Reader reader;
        ok &= check(!reader.open(file), "top-level moof rejected");
    }
    {
        std::vector<uint8_t> file;
        std::vector<uint8_t> moov;
        std::vector<uint8_t> mvhd(100, 0);
        append_atom(moov, 'mvhd', mvhd);
        append_atom(file, 'moov', moov);
        clipsplice::Mp4Reader reader;
        ok &= check(!reader.open(file), "zero movie timescale rejected");
    }
    {
        std::vector<uint8_t> file;
        std::vector<uint8_t> moov;
        std::vector<uint8_t> mvhd = full_box();
        write_u32_be(mvhd, 0);
        write_u32_be(mvhd, 0);
        write_u32_be(mvhd, 600);
        write_u32_be(mvhd, 6000);
        mvhd.resize(100, 0);
        append_atom(moov, 'mvhd', mvhd);
        append_atom(file, 'moov', moov);
        clipsplice::Mp4Reader reader;
        ok &= check(reader.open(file), "moov without tracks still opens");
        ok &= check(reader.info().tracks.empty() && reader.info().duration == 6000,
                    "trackless file keeps its movie header");
    }
    return ok;
}

bool test_parse_trak_direct() {
    Track video = uniform_track('vide', 30000, 8, 1001, 12, 4);
    video.empty_edit = 100;
    auto file = build_mp4({video});
    auto trak = find_payload(file, {'moov', 'trak'});
    if (!check(trak.has_value(), "fixture trak found")) {
        return false;
    }
    std::istringstream in(std::string(trak->begin(), trak->end()));
    auto parsed = parse_trak_for_test(in, trak->size());
    bool ok = check(parsed.has_value(), "parse_trak_for_test succeeds");
    if (!parsed) {
        return false;
    }
    ok &= check(parsed->descriptor.track_id == 1, "trak track id");
    ok &= check(parsed->descriptor.timescale == 30000, "trak timescale");
    ok &= check(parsed->descriptor.handler_type == fourcc('v', 'i', 'd', 'e'), "trak handler");
    ok &= check(parsed->empty_edit == 100, "leading empty edit picked up");
    ok &= check(!parsed->tables.stss.empty(), "stss captured");
    ok &= check(parsed->tables.ctts.empty(), "no ctts without offsets");
    ok &= check(!parsed->tables.co64, "stco, not co64");

    uint64_t count = 0;
    std::string why;
    ok &= check(validate_sample_tables(parsed->tables, count, why) && count == 8,
                "parsed tables validate");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_track_metadata();
    ok &= test_sample_walk();
    ok &= test_negative_ctts();
    ok &= test_co64_and_largesize();
    ok &= test_empty_edit();
    ok &= test_track_skipping();
    ok &= test_duplicate_track_ids();
    ok &= test_renumbering_avoids_later_ids();
    ok &= test_media_edit_offset_reported();
    ok &= test_rejections();
    ok &= test_parse_trak_direct();
    if (!ok) {
        return 1;
    }
    std::cout << "[reader_unit] all checks passed\n";
    return 0;
}
