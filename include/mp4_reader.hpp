//
//  mp4_reader.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <vector>

#include "container.hpp"
#include "media_types.hpp"
#include "sample_table.hpp"

struct Mp4AtomInfo {
    uint32_t type = 0;
    uint64_t size = 0;         // total atom size, 0 when the header is unusable.
    uint64_t offset = 0;       // offset in file.
    uint64_t header_size = 8;  // 16 with a 64-bit largesize.
};

// Utility: read big-endian 32-bit value.
uint32_t read_u32(std::istream &in);

// Utility: read big-endian 64-bit value.
uint64_t read_u64(std::istream &in);

namespace reader_detail {
struct TrackParseResult {
    clipsplice::TrackDescriptor descriptor;
    SampleTables tables;
    uint64_t empty_edit = 0;  // leading empty edit, movie timescale
    int64_t skipped_media_time = 0;  // start of the first media edit, not applied
};
}  // namespace reader_detail

namespace clipsplice {

// Demuxer for non-fragmented ISO-BMFF (MP4/M4V/MOV family) files held in memory.
class Mp4Reader : public ContainerReader {
   public:
    bool open(std::vector<uint8_t> bytes) override;
    const ContainerInfo &info() const override { return info_; }
    std::unique_ptr<SampleSequence> samples(uint32_t track_id) override;

   private:
    std::vector<uint8_t> data_;
    ContainerInfo info_;
    std::vector<SampleTables> tables_;  // parallel to info_.tracks
};

}  // namespace clipsplice

#ifdef CLIPSPLICE_TESTING
// Test-only wrapper that allows unit tests to exercise trak parsing directly.
std::optional<reader_detail::TrackParseResult> parse_trak_for_test(std::istream &in,
                                                                   uint64_t payload_size);
#endif
