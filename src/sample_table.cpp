//
//  sample_table.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sample_table.hpp"

#include <algorithm>
#include <cstddef>

#include "byte_io.hpp"
#include "logging.hpp"

using clipsplice::SampleRecord;

namespace {

constexpr size_t kFullBoxHeader = 4;       // version + flags
constexpr size_t kTableHeader = 8;         // version/flags + entry_count
constexpr size_t kStszHeaderSize = 12;     // version/flags + sample_size + sample_count
constexpr size_t kSttsEntrySize = 8;
constexpr size_t kCttsEntrySize = 8;
constexpr size_t kStssEntrySize = 4;
constexpr size_t kStscEntrySize = 12;

uint32_t entry_count(const std::vector<uint8_t> &table) {
    return load_u32(table.data() + kFullBoxHeader);
}

bool table_fits(const std::vector<uint8_t> &table, size_t entry_size) {
    if (table.size() < kTableHeader) {
        return false;
    }
    const uint64_t need =
        kTableHeader + static_cast<uint64_t>(entry_count(table)) * static_cast<uint64_t>(entry_size);
    return table.size() >= need;
}

}  // namespace

bool validate_sample_tables(const SampleTables &tables, uint64_t &sample_count,
                            std::string &why) {
    if (tables.stsz.size() < kStszHeaderSize) {
        why = "stsz missing or truncated";
        return false;
    }
    const uint32_t fixed_size = load_u32(tables.stsz.data() + 4);
    const uint32_t count = load_u32(tables.stsz.data() + 8);
    if (fixed_size == 0 &&
        tables.stsz.size() < kStszHeaderSize + static_cast<uint64_t>(count) * 4) {
        why = "stsz table truncated";
        return false;
    }
    if (!table_fits(tables.stts, kSttsEntrySize)) {
        why = "stts missing or truncated";
        return false;
    }
    uint64_t timed = 0;
    for (uint32_t i = 0; i < entry_count(tables.stts); ++i) {
        timed += load_u32(tables.stts.data() + kTableHeader + i * kSttsEntrySize);
    }
    if (timed < count) {
        why = "stts covers " + std::to_string(timed) + " of " + std::to_string(count) +
              " samples";
        return false;
    }
    if (!tables.ctts.empty() && !table_fits(tables.ctts, kCttsEntrySize)) {
        why = "ctts truncated";
        return false;
    }
    if (!tables.stss.empty() && !table_fits(tables.stss, kStssEntrySize)) {
        why = "stss truncated";
        return false;
    }
    if (!table_fits(tables.stsc, kStscEntrySize) || (count > 0 && entry_count(tables.stsc) == 0)) {
        why = "stsc missing or truncated";
        return false;
    }
    if (!table_fits(tables.stco, tables.co64 ? 8 : 4) ||
        (count > 0 && entry_count(tables.stco) == 0)) {
        why = tables.co64 ? "co64 missing or truncated" : "stco missing or truncated";
        return false;
    }
    sample_count = count;
    return true;
}

int32_t min_composition_offset(const SampleTables &tables) {
    if (tables.ctts.empty()) {
        return 0;
    }
    int32_t lowest = 0;
    const uint32_t entries = entry_count(tables.ctts);
    for (uint32_t i = 0; i < entries; ++i) {
        const uint8_t *entry = tables.ctts.data() + kTableHeader + i * kCttsEntrySize;
        if (load_u32(entry) == 0) {
            continue;
        }
        lowest = std::min(lowest, static_cast<int32_t>(load_u32(entry + 4)));
    }
    return lowest;
}

Mp4SampleSequence::Mp4SampleSequence(const std::vector<uint8_t> &file, const SampleTables &tables)
    : file_(file), tables_(tables) {
    uint64_t count = 0;
    std::string why;
    if (!validate_sample_tables(tables_, count, why)) {
        fail(why);
        return;
    }
    fixed_size_ = load_u32(tables_.stsz.data() + 4);
    sample_count_ = static_cast<uint32_t>(count);
    stts_entries_ = entry_count(tables_.stts);
    ctts_entries_ = tables_.ctts.empty() ? 0 : entry_count(tables_.ctts);
    stss_entries_ = tables_.stss.empty() ? 0 : entry_count(tables_.stss);
    stsc_entries_ = entry_count(tables_.stsc);
    chunk_count_ = entry_count(tables_.stco);
    next_dts_ = tables_.first_dts;
}

const SampleRecord *Mp4SampleSequence::fail(const std::string &why) {
    CS_LOG("warn", "sample table walk stopped at sample " << sample_index_ << ": " << why);
    failed_ = true;
    return nullptr;
}

bool Mp4SampleSequence::advance_chunk() {
    while (left_in_chunk_ == 0) {
        ++chunk_;
        if (chunk_ > chunk_count_) {
            fail("samples extend past the last chunk");
            return false;
        }
        while (stsc_entry_ + 1 < stsc_entries_ &&
               load_u32(tables_.stsc.data() + kTableHeader + (stsc_entry_ + 1) * kStscEntrySize) <=
                   chunk_) {
            ++stsc_entry_;
        }
        const uint8_t *entry = tables_.stsc.data() + kTableHeader + stsc_entry_ * kStscEntrySize;
        samples_per_chunk_ = load_u32(entry + 4);
        left_in_chunk_ = samples_per_chunk_;

        const uint8_t *offsets = tables_.stco.data() + kTableHeader;
        read_pos_ = tables_.co64 ? load_u64(offsets + (chunk_ - 1) * 8)
                                 : load_u32(offsets + (chunk_ - 1) * 4);
    }
    return true;
}

const SampleRecord *Mp4SampleSequence::next() {
    if (failed_ || sample_index_ >= sample_count_) {
        return nullptr;
    }
    if (left_in_chunk_ == 0 && !advance_chunk()) {
        return nullptr;
    }

    const uint32_t size = fixed_size_ != 0
                              ? fixed_size_
                              : load_u32(tables_.stsz.data() + kStszHeaderSize + sample_index_ * 4);
    if (read_pos_ > file_.size() || size > file_.size() - read_pos_) {
        return fail("sample at offset " + std::to_string(read_pos_) + " size " +
                    std::to_string(size) + " exceeds file size " + std::to_string(file_.size()));
    }

    while (stts_left_ == 0) {
        if (stts_entry_ >= stts_entries_) {
            return fail("stts exhausted");
        }
        const uint8_t *entry = tables_.stts.data() + kTableHeader + stts_entry_ * kSttsEntrySize;
        stts_left_ = load_u32(entry);
        stts_delta_ = load_u32(entry + 4);
        ++stts_entry_;
    }

    int32_t composition_offset = 0;
    while (ctts_left_ == 0 && ctts_entry_ < ctts_entries_) {
        const uint8_t *entry = tables_.ctts.data() + kTableHeader + ctts_entry_ * kCttsEntrySize;
        ctts_left_ = load_u32(entry);
        // Version 0 is nominally unsigned; encoders write negative offsets into it anyway.
        ctts_offset_ = static_cast<int32_t>(load_u32(entry + 4));
        ++ctts_entry_;
    }
    if (ctts_left_ > 0) {
        composition_offset = ctts_offset_;
        --ctts_left_;
    }

    bool sync = true;
    if (!tables_.stss.empty()) {
        const uint32_t number = sample_index_ + 1;
        auto stss_at = [&](uint32_t i) {
            return load_u32(tables_.stss.data() + kTableHeader + i * kStssEntrySize);
        };
        while (stss_entry_ < stss_entries_ && stss_at(stss_entry_) < number) {
            ++stss_entry_;
        }
        sync = stss_entry_ < stss_entries_ && stss_at(stss_entry_) == number;
    }

    current_.dts = next_dts_;
    current_.cts = next_dts_ + composition_offset;
    current_.duration = stts_delta_;
    current_.size = size;
    current_.is_sync = sync;
    current_.payload.assign(file_.begin() + static_cast<std::ptrdiff_t>(read_pos_),
                            file_.begin() + static_cast<std::ptrdiff_t>(read_pos_ + size));

    next_dts_ += stts_delta_;
    --stts_left_;
    read_pos_ += size;
    --left_in_chunk_;
    ++sample_index_;
    return &current_;
}
