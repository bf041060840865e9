/**
 * @file quota_types.cpp
 * @brief Error kind names
 */

#include "quota_types.hpp"

namespace lsquota {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::RemoteError:       return "RemoteError";
        case ErrorKind::MalformedUpstream: return "MalformedUpstream";
    }
    return "Unknown";
}

} // namespace lsquota
