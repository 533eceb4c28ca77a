#ifndef LEARNINGSTORE_HPP
#define LEARNINGSTORE_HPP

#include "LoadResult.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

class OpponentModel;
class StrategySelector;

// ============================================================================
// BlobStore - key/value storage for serialized learning state
// ============================================================================

class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool put(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

class MemoryBlobStore : public BlobStore {
public:
    MemoryBlobStore() = default;
    ~MemoryBlobStore() override = default;

    std::optional<std::string> get(const std::string& key) const override;
    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    size_t size() const { return blobs_.size(); }

private:
    std::map<std::string, std::string> blobs_;
};

// One <key>.json file per key inside `directory`, created on first put.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(const std::filesystem::path& directory);
    ~FileBlobStore() override = default;

    std::optional<std::string> get(const std::string& key) const override;
    bool put(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    std::filesystem::path pathFor(const std::string& key) const;
    const std::filesystem::path& getDirectory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

// ============================================================================
// LearningStore - JSON persistence for the bandit and the opponent model
// ============================================================================

class LearningStore {
public:
    static constexpr const char* BANDIT_KEY = "tictactoe_ai_bandit";
    static constexpr const char* BAYESIAN_KEY = "tictactoe_ai_bayesian";
    static constexpr const char* VERSION = "1.0.0";

    struct LoadReport {
        LoadResult bandit;
        LoadResult bayesian;

        bool ok() const { return bandit.ok() && bayesian.ok(); }
    };

    struct PersistenceInfo {
        bool hasSavedBanditData = false;
        bool hasSavedBayesianData = false;
        std::optional<int64_t> lastSavedTimestamp;
        std::string error;
    };

    // Both models are borrowed and must outlive the store.
    LearningStore(StrategySelector& selector, OpponentModel& model);

    std::string serializeBandit() const;
    std::string serializeBayesian() const;

    // Unparsable text, a wrong top-level shape or a blob with no valid entry
    // leaves the model untouched and reports CORRUPTED. Otherwise malformed
    // entries are skipped and counted.
    LoadResult deserializeBandit(const std::string& text);
    LoadResult deserializeBayesian(const std::string& text);

    bool save(BlobStore& store) const;
    LoadReport load(const BlobStore& store);
    // Restores both models to their seed state and erases the stored blobs
    // when `store` is given. False if a blob could not be erased.
    bool reset(BlobStore* store = nullptr);
    PersistenceInfo persistenceInfo(const BlobStore& store) const;

    static int64_t nowMs();

private:
    StrategySelector& selector_;
    OpponentModel& model_;
};

#endif // LEARNINGSTORE_HPP
