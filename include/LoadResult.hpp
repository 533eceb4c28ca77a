#ifndef LOADRESULT_HPP
#define LOADRESULT_HPP

#include <cstdint>
#include <string>

// Outcome of restoring learned state. Loading never throws; malformed
// entries are skipped and counted instead.
struct LoadResult {
    enum Status : uint8_t {
        LOADED = 0,     // every entry accepted
        PARTIAL = 1,    // some entries skipped
        NOT_FOUND = 2,  // nothing stored under the key
        CORRUPTED = 3   // unreadable or no valid entry, model left untouched
    };

    Status status = LOADED;
    int loadedEntries = 0;
    int skippedEntries = 0;
    std::string diagnostic;

    bool ok() const { return status == LOADED || status == PARTIAL; }

    static LoadResult fromCounts(int loaded, int skipped, const std::string& diagnostic = "") {
        LoadResult result;
        result.loadedEntries = loaded;
        result.skippedEntries = skipped;
        result.diagnostic = diagnostic;
        if (skipped == 0) {
            result.status = LOADED;
        } else if (loaded > 0) {
            result.status = PARTIAL;
        } else {
            result.status = CORRUPTED;
        }
        return result;
    }

    static LoadResult failure(Status status, const std::string& diagnostic) {
        LoadResult result;
        result.status = status;
        result.diagnostic = diagnostic;
        return result;
    }

    static const char* statusName(Status status) {
        switch (status) {
        case LOADED:
            return "loaded";
        case PARTIAL:
            return "partial";
        case NOT_FOUND:
            return "not found";
        case CORRUPTED:
            return "corrupted";
        }
        return "unknown";
    }
};

#endif // LOADRESULT_HPP
