//
//  fake_container.hpp
//  ClipSplice
//
//  Test-only container backends: scripted readers, recording writers and a counting wrapper
//  around the MP4 backend.
//

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "container.hpp"
#include "mp4_reader.hpp"
#include "mp4_writer.hpp"

namespace fake_container {

// One scripted source. `open()` selects it by the first byte of the input.
struct FakeSource {
    clipsplice::ContainerInfo info;
    std::vector<std::vector<clipsplice::SampleRecord>> samples;  // parallel to info.tracks
    bool parse_ok = true;
    size_t fail_track = SIZE_MAX;  // this track's sequence ends with failed() == true
};

// Hands out records from one reused buffer, like the MP4 sequence does.
class FakeSequence : public clipsplice::SampleSequence {
   public:
    FakeSequence(const std::vector<clipsplice::SampleRecord> &samples, bool fail_at_end)
        : samples_(samples), fail_at_end_(fail_at_end) {}

    const clipsplice::SampleRecord *next() override {
        if (pos_ >= samples_.size()) {
            failed_ = fail_at_end_;
            return nullptr;
        }
        const auto &src = samples_[pos_++];
        current_.dts = src.dts;
        current_.cts = src.cts;
        current_.duration = src.duration;
        current_.size = src.size;
        current_.is_sync = src.is_sync;
        current_.payload.assign(src.payload.begin(), src.payload.end());
        return &current_;
    }

    bool failed() const override { return failed_; }

   private:
    const std::vector<clipsplice::SampleRecord> &samples_;
    bool fail_at_end_ = false;
    bool failed_ = false;
    size_t pos_ = 0;
    clipsplice::SampleRecord current_;
};

struct Counters {
    int readers = 0;
    int writers = 0;
    int opens = 0;
};

class FakeReader : public clipsplice::ContainerReader {
   public:
    FakeReader(std::shared_ptr<const std::vector<FakeSource>> sources,
               std::shared_ptr<Counters> counters)
        : sources_(std::move(sources)), counters_(std::move(counters)) {}

    bool open(std::vector<uint8_t> bytes) override {
        ++counters_->opens;
        if (bytes.empty() || bytes[0] >= sources_->size()) {
            return false;
        }
        source_ = &(*sources_)[bytes[0]];
        return source_->parse_ok;
    }

    const clipsplice::ContainerInfo &info() const override { return source_->info; }

    std::unique_ptr<clipsplice::SampleSequence> samples(uint32_t track_id) override {
        for (size_t i = 0; i < source_->info.tracks.size(); ++i) {
            if (source_->info.tracks[i].track_id == track_id) {
                return std::make_unique<FakeSequence>(source_->samples[i],
                                                      source_->fail_track == i);
            }
        }
        return nullptr;
    }

   private:
    std::shared_ptr<const std::vector<FakeSource>> sources_;
    std::shared_ptr<Counters> counters_;
    const FakeSource *source_ = nullptr;
};

// What one RecordingWriter received; outlives the writer.
struct Recording {
    clipsplice::WriterOptions options;
    std::vector<clipsplice::TrackDescriptor> tracks;
    std::vector<std::vector<clipsplice::SampleRecord>> samples;
    bool finalized = false;
};

class RecordingWriter : public clipsplice::ContainerWriter {
   public:
    RecordingWriter(std::shared_ptr<Recording> recording, bool throw_on_finalize)
        : recording_(std::move(recording)), throw_on_finalize_(throw_on_finalize) {}

    uint32_t add_track(const clipsplice::TrackDescriptor &source) override {
        recording_->tracks.push_back(source);
        recording_->samples.emplace_back();
        return static_cast<uint32_t>(recording_->tracks.size());
    }

    void add_sample(uint32_t track_id, clipsplice::SampleRecord sample) override {
        if (track_id == 0 || track_id > recording_->samples.size()) {
            throw std::logic_error("unknown track");
        }
        recording_->samples[track_id - 1].push_back(std::move(sample));
        ++count_;
    }

    uint64_t sample_count() const override { return count_; }

    std::vector<uint8_t> finalize() override {
        if (throw_on_finalize_) {
            throw std::runtime_error("scripted finalize failure");
        }
        recording_->finalized = true;
        return {'f', 'a', 'k', 'e'};
    }

   private:
    std::shared_ptr<Recording> recording_;
    bool throw_on_finalize_ = false;
    uint64_t count_ = 0;
};

struct FakeBackend {
    clipsplice::ContainerBackend backend;
    std::shared_ptr<Counters> counters;
    std::shared_ptr<std::vector<std::shared_ptr<Recording>>> recordings;
};

inline FakeBackend make_fake_backend(std::vector<FakeSource> sources,
                                     bool throw_on_finalize = false) {
    FakeBackend fake;
    fake.counters = std::make_shared<Counters>();
    fake.recordings = std::make_shared<std::vector<std::shared_ptr<Recording>>>();
    auto shared_sources = std::make_shared<const std::vector<FakeSource>>(std::move(sources));
    auto counters = fake.counters;
    auto recordings = fake.recordings;
    fake.backend.make_reader = [shared_sources, counters]() {
        ++counters->readers;
        return std::unique_ptr<clipsplice::ContainerReader>(
            std::make_unique<FakeReader>(shared_sources, counters));
    };
    fake.backend.make_writer = [counters, recordings,
                                throw_on_finalize](const clipsplice::WriterOptions &options) {
        ++counters->writers;
        auto recording = std::make_shared<Recording>();
        recording->options = options;
        recordings->push_back(recording);
        return std::unique_ptr<clipsplice::ContainerWriter>(
            std::make_unique<RecordingWriter>(recording, throw_on_finalize));
    };
    return fake;
}

// The real MP4 backend with reader and writer construction counted.
inline clipsplice::ContainerBackend counting_mp4_backend(std::shared_ptr<Counters> counters) {
    clipsplice::ContainerBackend backend;
    backend.make_reader = [counters]() {
        ++counters->readers;
        return std::unique_ptr<clipsplice::ContainerReader>(
            std::make_unique<clipsplice::Mp4Reader>());
    };
    backend.make_writer = [counters](const clipsplice::WriterOptions &options) {
        ++counters->writers;
        return std::unique_ptr<clipsplice::ContainerWriter>(
            std::make_unique<clipsplice::Mp4Writer>(options));
    };
    return backend;
}

// Source with one video track (timescale 1000) whose samples sit at `dts_values`.
inline FakeSource video_source(const std::vector<int64_t> &dts_values, uint64_t duration_ms) {
    FakeSource source;
    source.info.timescale = 1000;
    source.info.duration = duration_ms;
    clipsplice::TrackDescriptor track;
    track.track_id = 1;
    track.media_type = clipsplice::MediaType::Video;
    track.handler_type = 'vide';
    track.timescale = 1000;
    track.codec_config = {0, 0, 0, 0, 0, 0, 0, 0};
    source.info.tracks.push_back(track);
    source.samples.emplace_back();
    uint8_t tag = 0;
    for (int64_t dts : dts_values) {
        clipsplice::SampleRecord s;
        s.dts = dts;
        s.cts = dts;
        s.duration = 40;
        s.size = 3;
        s.payload = {tag, static_cast<uint8_t>(tag + 1), static_cast<uint8_t>(tag + 2)};
        ++tag;
        source.samples.back().push_back(s);
    }
    return source;
}

}  // namespace fake_container
