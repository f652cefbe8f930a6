//
//  status.hpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tagforge {

/// Error taxonomy shared by the codec and the engine.
enum class ErrorKind {
    None = 0,
    ContainerRead,    ///< codec could not load a file
    ContainerWrite,   ///< codec could not persist a file
    Consistency,      ///< block or tag shape differs across the selection
    UnresolvedBlock,  ///< a reconciliation entry had no matching block
    Validation,       ///< rejected input, checked before any file I/O
};

const char *error_kind_name(ErrorKind kind);

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `kind` classifies the error and `path`
 * names the offending file when there is one.
 */
struct Status {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::string path;
};

inline Status ok_status() { return Status{}; }

inline Status make_error(ErrorKind kind, std::string msg, std::string path = {}) {
    return Status{false, kind, std::move(msg), std::move(path)};
}

/**
 * @brief Outcome of an operation that writes several files in turn.
 *
 * Loops stop at the first failing file. `completed` lists the files that were already written
 * when that happened; they are not rolled back. `advisories` carries non-fatal warnings.
 */
struct BatchResult {
    Status status;
    std::vector<std::string> completed;
    std::vector<std::string> advisories;

    bool ok() const { return status.ok; }
};

// Human readable one-liner, e.g. "ContainerWrite: disk full (/music/a.flac)".
std::string describe(const Status &status);

}  // namespace tagforge
