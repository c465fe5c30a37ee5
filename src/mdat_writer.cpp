//
//  mdat_writer.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mdat_writer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "logging.hpp"

// -----------------------------------------------------------------------------
// Chunk plan.
// -----------------------------------------------------------------------------
std::vector<uint32_t> build_chunk_plan(const TrackSamples &samples, uint64_t max_span) {
    std::vector<uint32_t> plan;
    int64_t chunk_start = 0;
    for (const auto &s : samples) {
        if (plan.empty() || static_cast<uint64_t>(s.dts - chunk_start) >= max_span) {
            plan.push_back(0);
            chunk_start = s.dts;
        }
        ++plan.back();
    }
    return plan;
}

// -----------------------------------------------------------------------------
// Interleave chunks of all tracks.
// -----------------------------------------------------------------------------
std::vector<MdatChunk> interleave_chunks(const std::vector<TrackSamples> &tracks,
                                         const std::vector<std::vector<uint32_t>> &plans,
                                         const std::vector<uint64_t> &timescales) {
    struct Timed {
        double start;
        MdatChunk chunk;
    };
    std::vector<Timed> timed;

    for (size_t t = 0; t < tracks.size(); ++t) {
        size_t sample_index = 0;
        for (uint32_t chunk_size : plans[t]) {
            MdatChunk chunk;
            chunk.track = t;
            chunk.first_sample = sample_index;
            chunk.sample_count = chunk_size;
            for (uint32_t i = 0; i < chunk_size; ++i) {
                chunk.bytes += tracks[t][sample_index + i].payload.size();
            }
            const double start = timescales[t] ? static_cast<double>(tracks[t][sample_index].dts) /
                                                     static_cast<double>(timescales[t])
                                               : 0.0;
            timed.push_back({start, chunk});
            sample_index += chunk_size;
        }
        if (sample_index != tracks[t].size()) {
            throw std::logic_error("chunk plan does not cover every sample of track " +
                                   std::to_string(t + 1));
        }
    }

    std::stable_sort(timed.begin(), timed.end(),
                     [](const Timed &a, const Timed &b) { return a.start < b.start; });

    std::vector<MdatChunk> chunks;
    chunks.reserve(timed.size());
    for (const auto &entry : timed) {
        chunks.push_back(entry.chunk);
    }
    return chunks;
}

uint64_t mdat_payload_size(const std::vector<MdatChunk> &chunks) {
    uint64_t total = 0;
    for (const auto &chunk : chunks) {
        total += chunk.bytes;
    }
    return total;
}

// -----------------------------------------------------------------------------
// Compute offsets only (no writing), given a payload start.
// -----------------------------------------------------------------------------
std::vector<std::vector<uint64_t>> compute_chunk_offsets(uint64_t payload_start,
                                                         const std::vector<MdatChunk> &chunks,
                                                         size_t track_count) {
    std::vector<std::vector<uint64_t>> offsets(track_count);
    uint64_t cursor = payload_start;
    for (const auto &chunk : chunks) {
        offsets[chunk.track].push_back(cursor);
        cursor += chunk.bytes;
    }
    return offsets;
}

// -----------------------------------------------------------------------------
// Write mdat.
// -----------------------------------------------------------------------------
void write_mdat(std::vector<uint8_t> &out, const std::vector<MdatChunk> &chunks,
                const std::vector<TrackSamples> &tracks) {
    const uint64_t payload = mdat_payload_size(chunks);
    write_box_header(out, fourcc("mdat"), payload);
    out.reserve(out.size() + payload);

    for (const auto &chunk : chunks) {
        const auto &samples = tracks[chunk.track];
        for (uint32_t i = 0; i < chunk.sample_count; ++i) {
            const auto &bytes = samples[chunk.first_sample + i].payload;
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
    }
}

// -----------------------------------------------------------------------------
// Patch a single stco/co64 table.
// -----------------------------------------------------------------------------
void patch_chunk_offsets(Atom *table, const std::vector<uint64_t> &offsets) {
    if (!table) {
        return;
    }
    auto &p = table->payload;
    if (p.size() < 8) {
        return;
    }

    const bool co64 = table->type == fourcc("co64");
    const size_t entry_size = co64 ? 8 : 4;
    const uint32_t entry_count = load_u32(p.data() + 4);
    if (entry_count != offsets.size() || p.size() < 8 + entry_count * entry_size) {
        throw std::logic_error("chunk offset table does not match the mdat layout");
    }

    size_t pos = 8;
    for (uint64_t offset : offsets) {
        if (co64) {
            store_u64(p, pos, offset);
        } else {
            if (offset > 0xFFFFFFFFULL) {
                throw std::logic_error("chunk offset needs co64");
            }
            store_u32(p, pos, static_cast<uint32_t>(offset));
        }
        pos += entry_size;
    }
}

// -----------------------------------------------------------------------------
// Patch all chunk offset tables (in trak order).
// -----------------------------------------------------------------------------
void patch_all_chunk_offsets(Atom *moov, const std::vector<std::vector<uint64_t>> &offsets) {
    if (!moov) {
        return;
    }
    auto traks = moov->find("trak");
    if (traks.size() != offsets.size()) {
        throw std::logic_error("moov holds " + std::to_string(traks.size()) + " tracks, layout " +
                               std::to_string(offsets.size()));
    }
    for (size_t i = 0; i < traks.size(); ++i) {
        auto tables = traks[i]->find("stco");
        if (tables.empty()) {
            tables = traks[i]->find("co64");
        }
        if (tables.empty()) {
            throw std::logic_error("trak without chunk offset table");
        }
        patch_chunk_offsets(tables.front(), offsets[i]);
        CS_LOG("debug", "patched " << offsets[i].size() << " chunk offsets of track " << (i + 1));
    }
}
