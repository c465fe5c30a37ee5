//
//  sample_table.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "container.hpp"
#include "media_types.hpp"

// Raw sample table payloads of one track (box payloads without the 8-byte header).
struct SampleTables {
    std::vector<uint8_t> stts;
    std::vector<uint8_t> ctts;  // optional
    std::vector<uint8_t> stss;  // optional; absent means every sample is a sync sample
    std::vector<uint8_t> stsz;
    std::vector<uint8_t> stsc;
    std::vector<uint8_t> stco;  // stco or co64 payload
    bool co64 = false;
    int64_t first_dts = 0;  // media time of the first sample, from a leading empty edit
};

// Check every table header against its declared entry count. On success `sample_count`
// holds the stsz sample count; on failure `why` names the offending table.
bool validate_sample_tables(const SampleTables &tables, uint64_t &sample_count,
                            std::string &why);

// Smallest composition offset in a validated ctts, 0 without one. Offsets are signed in both
// ctts versions.
int32_t min_composition_offset(const SampleTables &tables);

// Walks stts/ctts/stss/stsz/stsc/stco run by run, reading one payload at a time from `file`.
// Both referenced objects must outlive the sequence.
class Mp4SampleSequence : public clipsplice::SampleSequence {
   public:
    Mp4SampleSequence(const std::vector<uint8_t> &file, const SampleTables &tables);

    const clipsplice::SampleRecord *next() override;
    bool failed() const override { return failed_; }

   private:
    bool advance_chunk();
    const clipsplice::SampleRecord *fail(const std::string &why);

    const std::vector<uint8_t> &file_;
    const SampleTables &tables_;

    uint32_t fixed_size_ = 0;
    uint32_t sample_count_ = 0;
    uint32_t sample_index_ = 0;

    // stts run.
    uint32_t stts_entries_ = 0;
    uint32_t stts_entry_ = 0;
    uint32_t stts_left_ = 0;
    uint32_t stts_delta_ = 0;
    int64_t next_dts_ = 0;

    // ctts run.
    uint32_t ctts_entries_ = 0;
    uint32_t ctts_entry_ = 0;
    uint32_t ctts_left_ = 0;
    int32_t ctts_offset_ = 0;

    // stss cursor.
    uint32_t stss_entries_ = 0;
    uint32_t stss_entry_ = 0;

    // stsc/stco cursor.
    uint32_t stsc_entries_ = 0;
    uint32_t stsc_entry_ = 0;
    uint32_t chunk_count_ = 0;
    uint32_t chunk_ = 0;  // 1-based, 0 before the first chunk
    uint32_t samples_per_chunk_ = 0;
    uint32_t left_in_chunk_ = 0;
    uint64_t read_pos_ = 0;

    bool failed_ = false;
    clipsplice::SampleRecord current_;
};
