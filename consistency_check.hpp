#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "event_sink.hpp"
#include "exclude_filter.hpp"

namespace mirrord {

struct ConsistencyReport {
    std::size_t files_compared{0};
    std::vector<Inconsistency> inconsistencies;
    std::vector<EntryError> errors;
    double duration_seconds{0.0};
    std::optional<std::string> abort_reason;

    ConsistencySummary summary() const;
};

/**
 * Read-only audit of files present in both trees: size first, then an
 * XXH64 digest of the content. It surfaces what the mtime heuristic cannot
 * see (same or older source mtime, different bytes) and never repairs it.
 */
class ConsistencyChecker {
public:
    explicit ConsistencyChecker(EventSink& sink, ExcludeFilter exclude = {});

    ConsistencyReport run(const std::filesystem::path& source_root,
                          const std::filesystem::path& destination_root);

private:
    EventSink& sink_;
    ExcludeFilter exclude_;
};

}
