//
//  mp4_backend.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <memory>

#include "container.hpp"
#include "mp4_reader.hpp"
#include "mp4_writer.hpp"

namespace clipsplice {

ContainerBackend mp4_backend() {
    ContainerBackend backend;
    backend.make_reader = [] { return std::make_unique<Mp4Reader>(); };
    backend.make_writer = [](const WriterOptions &options) {
        return std::make_unique<Mp4Writer>(options);
    };
    return backend;
}

}  // namespace clipsplice
