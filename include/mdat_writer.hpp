//
//  mdat_writer.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <vector>

#include "media_types.hpp"
#include "mp4_atoms.hpp"

using TrackSamples = std::vector<clipsplice::SampleRecord>;

// A run of consecutive samples of one track stored back to back in mdat.
struct MdatChunk {
    size_t track = 0;
    size_t first_sample = 0;
    uint32_t sample_count = 0;
    uint64_t bytes = 0;
};

// Samples-per-chunk plan: a chunk closes once it spans `max_span` ticks.
std::vector<uint32_t> build_chunk_plan(const TrackSamples &samples, uint64_t max_span);

// Order the chunks of all tracks by start time (track order breaks ties).
std::vector<MdatChunk> interleave_chunks(const std::vector<TrackSamples> &tracks,
                                         const std::vector<std::vector<uint32_t>> &plans,
                                         const std::vector<uint64_t> &timescales);

uint64_t mdat_payload_size(const std::vector<MdatChunk> &chunks);

// Absolute file offsets of every chunk, per track, for a payload starting at `payload_start`.
std::vector<std::vector<uint64_t>> compute_chunk_offsets(uint64_t payload_start,
                                                         const std::vector<MdatChunk> &chunks,
                                                         size_t track_count);

// Append mdat (header + payload in chunk order) to `out`.
void write_mdat(std::vector<uint8_t> &out, const std::vector<MdatChunk> &chunks,
                const std::vector<TrackSamples> &tracks);

// Patch a single stco or co64 atom.
void patch_chunk_offsets(Atom *table, const std::vector<uint64_t> &offsets);

// Patch the chunk offset table of every trak in moov, in track order.
void patch_all_chunk_offsets(Atom *moov, const std::vector<std::vector<uint64_t>> &offsets);
