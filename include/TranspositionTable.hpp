#ifndef TRANSPOSITION_TABLE_HPP
#define TRANSPOSITION_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <unordered_map>

// Bounded memo for the exact search. Values are stored with the bound they
// represent so a score cut off by alpha-beta is never reused as exact.
class TranspositionTable {
  public:
    enum EntryType : uint8_t { EXACT = 0, LOWER_BOUND = 1, UPPER_BOUND = 2 };

    struct Entry {
        int value = 0;
        EntryType type = EXACT;
    };

    static constexpr size_t DEFAULT_MAX_ENTRIES = 1000;

    explicit TranspositionTable(size_t maxEntries = DEFAULT_MAX_ENTRIES)
        : maxEntries_(maxEntries > 0 ? maxEntries : 1) {
        table_.reserve(maxEntries_);
    }

    const Entry *probe(uint64_t key) const {
        auto it = table_.find(key);
        if (it != table_.end())
            return &it->second;
        return nullptr;
    }

    void store(uint64_t key, int value, EntryType type) {
        // Drop everything once the cap is reached
        if (table_.size() >= maxEntries_ && table_.find(key) == table_.end()) {
            table_.clear();
            ++clears_;
        }
        Entry &e = table_[key];
        e.value = value;
        e.type = type;
    }

    void clear() { table_.clear(); }

    size_t size() const { return table_.size(); }
    size_t capacity() const { return maxEntries_; }
    size_t clearCount() const { return clears_; }

  private:
    std::unordered_map<uint64_t, Entry> table_;
    size_t maxEntries_;
    size_t clears_ = 0;
};

#endif // TRANSPOSITION_TABLE_HPP
