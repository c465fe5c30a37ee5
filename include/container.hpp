//
//  container.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "media_types.hpp"

namespace clipsplice {

/**
 * @brief Lazy, finite sequence of samples of one track, in file order.
 *
 * `next()` returns a record owned by the sequence; both the record and its payload buffer are
 * overwritten by the following call. Exhaustion is signalled by `nullptr`; `failed()` tells a
 * read error apart from a clean end.
 */
class SampleSequence {
   public:
    virtual ~SampleSequence() = default;

    virtual const SampleRecord *next() = 0;
    virtual bool failed() const = 0;
};

// Demux side of a container adapter. One instance per logical operation.
class ContainerReader {
   public:
    virtual ~ContainerReader() = default;

    // Takes ownership of the bytes; the reader may keep or consume them.
    virtual bool open(std::vector<uint8_t> bytes) = 0;

    // Valid after a successful open().
    virtual const ContainerInfo &info() const = 0;

    // nullptr for an unknown track id.
    virtual std::unique_ptr<SampleSequence> samples(uint32_t track_id) = 0;
};

// Remux side of a container adapter. Finalized exactly once.
class ContainerWriter {
   public:
    virtual ~ContainerWriter() = default;

    // Mirrors `source` (codec config verbatim, counters reset); returns the new track id.
    virtual uint32_t add_track(const TrackDescriptor &source) = 0;

    virtual void add_sample(uint32_t track_id, SampleRecord sample) = 0;

    virtual uint64_t sample_count() const = 0;

    virtual std::vector<uint8_t> finalize() = 0;
};

struct WriterOptions {
    uint64_t movie_timescale = 1000;
    bool fast_start = true;  // moov ahead of mdat
};

// Factory pair handed to the engines so every call builds fresh adapter instances.
struct ContainerBackend {
    std::function<std::unique_ptr<ContainerReader>()> make_reader;
    std::function<std::unique_ptr<ContainerWriter>(const WriterOptions &)> make_writer;
};

// Backend for ISO-BMFF / MP4 files.
ContainerBackend mp4_backend();

}  // namespace clipsplice
