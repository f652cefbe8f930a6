//
//  status.cpp
//  TagForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "status.hpp"

namespace tagforge {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::ContainerRead:
            return "ContainerReadError";
        case ErrorKind::ContainerWrite:
            return "ContainerWriteError";
        case ErrorKind::Consistency:
            return "ConsistencyError";
        case ErrorKind::UnresolvedBlock:
            return "UnresolvedBlockError";
        case ErrorKind::Validation:
            return "ValidationError";
    }
    return "Unknown";
}

std::string describe(const Status &status) {
    if (status.ok) {
        return "ok";
    }
    std::string out = error_kind_name(status.kind);
    out += ": ";
    out += status.message;
    if (!status.path.empty()) {
        out += " (" + status.path + ")";
    }
    return out;
}

}  // namespace tagforge
