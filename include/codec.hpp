//
//  codec.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "flac_file.hpp"
#include "status.hpp"

namespace tagforge {

/**
 * @brief Container collaborator used by the engine to load and persist files.
 *
 * Implementations own the binary format; the engine only sees `FlacFile`.
 */
class Codec {
   public:
    virtual ~Codec() = default;

    /// Load `path` into `out`. Fails with ErrorKind::ContainerRead.
    virtual Status load(const std::string &path, FlacFile &out) = 0;

    /**
     * @brief Persist `file` to `file.path`.
     *
     * Tags are re-encoded into the VORBIS_COMMENT block first. With `padding` set, all
     * PADDING blocks are replaced by a single trailing block of that many bytes.
     * Fails with ErrorKind::ContainerWrite.
     */
    virtual Status save(FlacFile &file, std::optional<uint32_t> padding = std::nullopt) = 0;
};

}  // namespace tagforge
