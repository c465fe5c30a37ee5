//
//  stbl_builder.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "stbl_builder.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

using clipsplice::SampleRecord;

std::unique_ptr<Atom> build_stts(const std::vector<SampleRecord> &samples) {
    auto stts = Atom::create("stts");
    auto &p = stts->payload;

    std::vector<std::pair<uint32_t, uint32_t>> runs;  // (count, delta)
    for (size_t i = 0; i < samples.size(); ++i) {
        uint32_t delta = samples[i].duration;
        if (i + 1 < samples.size()) {
            const int64_t gap = samples[i + 1].dts - samples[i].dts;
            if (gap < 0 || gap > std::numeric_limits<uint32_t>::max()) {
                throw std::logic_error("stts: sample " + std::to_string(i + 1) +
                                       " breaks decode order");
            }
            delta = static_cast<uint32_t>(gap);
        }
        if (!runs.empty() && runs.back().second == delta) {
            ++runs.back().first;
        } else {
            runs.emplace_back(1, delta);
        }
    }

    write_u8(p, 0);
    write_u24(p, 0);
    write_u32(p, static_cast<uint32_t>(runs.size()));
    for (const auto &[count, delta] : runs) {
        write_u32(p, count);
        write_u32(p, delta);
    }
    return stts;
}

std::unique_ptr<Atom> build_ctts(const std::vector<SampleRecord> &samples) {
    bool any_offset = false;
    bool any_negative = false;
    for (const auto &s : samples) {
        const int64_t offset = s.cts - s.dts;
        if (offset < std::numeric_limits<int32_t>::min() ||
            offset > std::numeric_limits<int32_t>::max()) {
            throw std::logic_error("ctts: composition offset out of range");
        }
        any_offset |= offset != 0;
        any_negative |= offset < 0;
    }
    if (!any_offset) {
        return nullptr;
    }

    std::vector<std::pair<uint32_t, int32_t>> runs;  // (count, offset)
    for (const auto &s : samples) {
        const auto offset = static_cast<int32_t>(s.cts - s.dts);
        if (!runs.empty() && runs.back().second == offset) {
            ++runs.back().first;
        } else {
            runs.emplace_back(1, offset);
        }
    }

    auto ctts = Atom::create("ctts");
    auto &p = ctts->payload;
    write_u8(p, any_negative ? 1 : 0);
    write_u24(p, 0);
    write_u32(p, static_cast<uint32_t>(runs.size()));
    for (const auto &[count, offset] : runs) {
        write_u32(p, count);
        write_u32(p, static_cast<uint32_t>(offset));
    }
    return ctts;
}

std::unique_ptr<Atom> build_stss(const std::vector<SampleRecord> &samples) {
    std::vector<uint32_t> sync;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (samples[i].is_sync) {
            sync.push_back(static_cast<uint32_t>(i + 1));  // 1-based
        }
    }
    if (sync.size() == samples.size()) {
        return nullptr;
    }

    auto stss = Atom::create("stss");
    auto &p = stss->payload;
    write_u8(p, 0);
    write_u24(p, 0);
    write_u32(p, static_cast<uint32_t>(sync.size()));
    for (uint32_t number : sync) {
        write_u32(p, number);
    }
    return stss;
}

std::unique_ptr<Atom> build_stsz(const std::vector<SampleRecord> &samples) {
    auto stsz = Atom::create("stsz");
    auto &p = stsz->payload;

    bool constant = !samples.empty();
    for (const auto &s : samples) {
        constant &= s.size == samples.front().size;
    }
    // A constant size of 0 would read as "table follows".
    if (constant && samples.front().size == 0) {
        constant = false;
    }

    write_u8(p, 0);
    write_u24(p, 0);
    write_u32(p, constant ? samples.front().size : 0);
    write_u32(p, static_cast<uint32_t>(samples.size()));
    if (!constant) {
        for (const auto &s : samples) {
            write_u32(p, s.size);
        }
    }
    return stsz;
}

std::unique_ptr<Atom> build_stsc(const std::vector<uint32_t> &chunk_sizes) {
    auto stsc = Atom::create("stsc");
    auto &p = stsc->payload;

    // (first_chunk, samples_per_chunk); a new entry only where the chunk size changes.
    std::vector<std::pair<uint32_t, uint32_t>> entries;
    for (size_t i = 0; i < chunk_sizes.size(); ++i) {
        if (entries.empty() || entries.back().second != chunk_sizes[i]) {
            entries.emplace_back(static_cast<uint32_t>(i + 1), chunk_sizes[i]);
        }
    }

    write_u8(p, 0);
    write_u24(p, 0);
    write_u32(p, static_cast<uint32_t>(entries.size()));
    for (const auto &[first_chunk, samples_per_chunk] : entries) {
        write_u32(p, first_chunk);
        write_u32(p, samples_per_chunk);
        write_u32(p, 1);  // sample_description_index
    }
    return stsc;
}

std::unique_ptr<Atom> build_stco(size_t chunk_count, bool co64) {
    auto stco = Atom::create(co64 ? "co64" : "stco");
    auto &p = stco->payload;

    write_u8(p, 0);
    write_u24(p, 0);
    write_u32(p, static_cast<uint32_t>(chunk_count));

    // offset placeholders (patched by the mdat layout)
    p.resize(p.size() + chunk_count * (co64 ? 8 : 4), 0);
    return stco;
}

std::unique_ptr<Atom> build_stbl(const std::vector<uint8_t> &codec_config,
                                 const std::vector<SampleRecord> &samples,
                                 const std::vector<uint32_t> &chunk_sizes, bool co64) {
    auto stbl = Atom::create("stbl");

    auto stsd = Atom::create("stsd");
    stsd->payload = codec_config;
    stbl->add(std::move(stsd));

    stbl->add(build_stts(samples));
    stbl->add(build_ctts(samples));
    stbl->add(build_stss(samples));
    stbl->add(build_stsc(chunk_sizes));
    stbl->add(build_stsz(samples));
    stbl->add(build_stco(chunk_sizes.size(), co64));

    return stbl;
}
