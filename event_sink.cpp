#include "event_sink.hpp"

namespace mirrord {

const char* to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::CREATED: return "created";
        case ChangeKind::MODIFIED: return "modified";
        case ChangeKind::REMOVED: return "removed";
    }
    return "unknown";
}

const char* to_string(EntryType type) {
    switch (type) {
        case EntryType::FILE: return "file";
        case EntryType::DIRECTORY: return "directory";
    }
    return "unknown";
}

}
