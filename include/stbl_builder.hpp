//
//  stbl_builder.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "media_types.hpp"
#include "mp4_atoms.hpp"

// Sample tables are rebuilt from the records of one track, in decode order. Timestamps are
// taken relative to the first sample's DTS; the caller expresses that lead as an edit.

// Run-length time-to-sample table. Each delta is the DTS distance to the next sample; the last
// sample keeps its own duration.
std::unique_ptr<Atom> build_stts(const std::vector<clipsplice::SampleRecord> &samples);

// Composition offsets, or nullptr when every CTS equals its DTS. Version 1 (signed) when any
// offset is negative.
std::unique_ptr<Atom> build_ctts(const std::vector<clipsplice::SampleRecord> &samples);

// Sync sample table, or nullptr when every sample is a sync sample.
std::unique_ptr<Atom> build_stss(const std::vector<clipsplice::SampleRecord> &samples);

// Sample sizes; constant-size form when all sizes match.
std::unique_ptr<Atom> build_stsz(const std::vector<clipsplice::SampleRecord> &samples);

// Run-length sample-to-chunk table from a samples-per-chunk plan.
std::unique_ptr<Atom> build_stsc(const std::vector<uint32_t> &chunk_sizes);

// Chunk offset table with zeroed placeholders, patched once the mdat layout is known.
std::unique_ptr<Atom> build_stco(size_t chunk_count, bool co64);

// Complete stbl. `codec_config` becomes the stsd payload byte-for-byte.
std::unique_ptr<Atom> build_stbl(const std::vector<uint8_t> &codec_config,
                                 const std::vector<clipsplice::SampleRecord> &samples,
                                 const std::vector<uint32_t> &chunk_sizes, bool co64);
