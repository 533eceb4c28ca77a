#include "LearningStore.hpp"
#include "OpponentModel.hpp"
#include "StrategySelector.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace {

bool readCount(const json& j, const char* field, int& out) {
    if (!j.contains(field) || !j.at(field).is_number()) {
        return false;
    }
    double value = j.at(field).get<double>();
    if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool readNumber(const json& j, const char* field, double& out) {
    if (!j.contains(field) || !j.at(field).is_number()) {
        return false;
    }
    out = j.at(field).get<double>();
    return std::isfinite(out);
}

bool parseArm(const json& j, StrategySelector::ArmStats& out) {
    if (!j.is_object()) return false;
    try {
        out.name = j.at("name").get<std::string>();
    } catch (const json::exception&) {
        return false;
    }
    return readCount(j, "wins", out.wins) &&
           readCount(j, "losses", out.losses) &&
           readCount(j, "draws", out.draws) &&
           readCount(j, "total", out.total) &&
           readNumber(j, "alpha", out.alpha) &&
           readNumber(j, "beta", out.beta);
}

bool parsePattern(const json& j, OpponentModel::PatternDetail& out) {
    if (!j.is_object()) return false;
    if (!j.contains("probabilities") || !j.at("probabilities").is_array()) return false;
    try {
        out.boardState = j.at("boardState").get<std::string>();
    } catch (const json::exception&) {
        return false;
    }
    out.observations = 1;
    if (j.contains("observations") && !readCount(j, "observations", out.observations)) {
        return false;
    }

    out.probabilities.clear();
    for (const auto& pj : j.at("probabilities")) {
        if (!pj.is_object()) return false;
        double move = 0.0;
        OpponentModel::MoveProbability mp;
        if (!readNumber(pj, "move", move) || std::floor(move) != move ||
            move < 0.0 || move >= Board::CELLS ||
            !readNumber(pj, "probability", mp.probability)) {
            return false;
        }
        mp.move = static_cast<int>(move);
        out.probabilities.push_back(mp);
    }
    return true;
}

bool versionSupported(const json& root) {
    if (!root.contains("version")) {
        return true;
    }
    const json& version = root.at("version");
    return version.is_string() && version.get<std::string>() == LearningStore::VERSION;
}

LoadResult withExtraSkips(LoadResult result, int shapeSkipped, const std::string& diagnostic) {
    if (shapeSkipped == 0) {
        return result;
    }
    std::string message = result.diagnostic.empty() ? diagnostic : result.diagnostic;
    return LoadResult::fromCounts(result.loadedEntries, result.skippedEntries + shapeSkipped, message);
}

} // namespace

// ============================================================================
// MemoryBlobStore
// ============================================================================

std::optional<std::string> MemoryBlobStore::get(const std::string& key) const {
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBlobStore::put(const std::string& key, const std::string& value) {
    blobs_[key] = value;
    return true;
}

bool MemoryBlobStore::remove(const std::string& key) {
    return blobs_.erase(key) > 0;
}

// ============================================================================
// FileBlobStore
// ============================================================================

FileBlobStore::FileBlobStore(const std::filesystem::path& directory)
    : directory_(directory) {
}

std::filesystem::path FileBlobStore::pathFor(const std::string& key) const {
    return directory_ / (key + ".json");
}

std::optional<std::string> FileBlobStore::get(const std::string& key) const {
    std::ifstream in(pathFor(key), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return contents.str();
}

bool FileBlobStore::put(const std::string& key, const std::string& value) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return false;
    }

    // Write a temp file, then rename it over the target
    std::filesystem::path target = pathFor(key);
    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out << value;
        if (!out.flush()) {
            return false;
        }
    }
    std::filesystem::rename(temp, target, ec);
    return !ec;
}

bool FileBlobStore::remove(const std::string& key) {
    std::error_code ec;
    bool removed = std::filesystem::remove(pathFor(key), ec);
    return removed && !ec;
}

// ============================================================================
// LearningStore
// ============================================================================

LearningStore::LearningStore(StrategySelector& selector, OpponentModel& model)
    : selector_(selector)
    , model_(model) {
}

int64_t LearningStore::nowMs() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::string LearningStore::serializeBandit() const {
    StrategySelector::BanditStats stats = selector_.getStats();

    json strategies = json::array();
    for (const auto& arm : stats.strategies) {
        strategies.push_back(json{
            {"name", arm.name},
            {"wins", arm.wins},
            {"losses", arm.losses},
            {"draws", arm.draws},
            {"total", arm.total},
            {"winRate", arm.winRate},
            {"alpha", arm.alpha},
            {"beta", arm.beta},
            {"expectedValue", arm.expectedValue}
        });
    }

    json root{
        {"version", VERSION},
        {"timestamp", nowMs()},
        {"strategies", strategies}
    };
    root["currentStrategy"] = stats.currentStrategy ? json(*stats.currentStrategy) : json(nullptr);
    return root.dump();
}

std::string LearningStore::serializeBayesian() const {
    OpponentModel::BayesianStats stats = model_.getStats();

    json patterns = json::array();
    for (const auto& detail : stats.patternDetails) {
        json probabilities = json::array();
        for (const auto& mp : detail.probabilities) {
            probabilities.push_back(json{{"move", mp.move}, {"probability", mp.probability}});
        }
        patterns.push_back(json{
            {"boardState", detail.boardState},
            {"observations", detail.observations},
            {"probabilities", probabilities}
        });
    }

    json root{
        {"version", VERSION},
        {"timestamp", nowMs()},
        {"totalPatterns", stats.totalPatterns},
        {"patternDetails", patterns}
    };
    return root.dump();
}

LoadResult LearningStore::deserializeBandit(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return LoadResult::failure(LoadResult::CORRUPTED, "bandit blob is not a JSON object");
    }
    if (!versionSupported(root)) {
        return LoadResult::failure(LoadResult::CORRUPTED, "unsupported bandit blob version");
    }
    if (!root.contains("strategies") || !root.at("strategies").is_array()) {
        return LoadResult::failure(LoadResult::CORRUPTED, "bandit blob has no strategies array");
    }

    StrategySelector::BanditStats stats;
    int shapeSkipped = 0;
    for (const auto& entry : root.at("strategies")) {
        StrategySelector::ArmStats arm;
        if (!parseArm(entry, arm)) {
            shapeSkipped++;
            continue;
        }
        stats.strategies.push_back(arm);
    }
    if (stats.strategies.empty() && shapeSkipped > 0) {
        return LoadResult::fromCounts(0, shapeSkipped, "no valid strategy entries");
    }

    if (root.contains("currentStrategy") && root.at("currentStrategy").is_string()) {
        stats.currentStrategy = root.at("currentStrategy").get<std::string>();
    }

    LoadResult result = selector_.load(stats);
    return withExtraSkips(result, shapeSkipped, "malformed strategy entry");
}

LoadResult LearningStore::deserializeBayesian(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return LoadResult::failure(LoadResult::CORRUPTED, "bayesian blob is not a JSON object");
    }
    if (!versionSupported(root)) {
        return LoadResult::failure(LoadResult::CORRUPTED, "unsupported bayesian blob version");
    }
    if (!root.contains("patternDetails") || !root.at("patternDetails").is_array()) {
        return LoadResult::failure(LoadResult::CORRUPTED, "bayesian blob has no patternDetails array");
    }

    OpponentModel::BayesianStats stats;
    int shapeSkipped = 0;
    for (const auto& entry : root.at("patternDetails")) {
        OpponentModel::PatternDetail detail;
        if (!parsePattern(entry, detail)) {
            shapeSkipped++;
            continue;
        }
        stats.patternDetails.push_back(std::move(detail));
    }
    if (stats.patternDetails.empty() && shapeSkipped > 0) {
        return LoadResult::fromCounts(0, shapeSkipped, "no valid pattern entries");
    }
    stats.totalPatterns = static_cast<int>(stats.patternDetails.size());

    LoadResult result = model_.load(stats);
    return withExtraSkips(result, shapeSkipped, "malformed pattern entry");
}

bool LearningStore::save(BlobStore& store) const {
    bool banditSaved = store.put(BANDIT_KEY, serializeBandit());
    bool bayesianSaved = store.put(BAYESIAN_KEY, serializeBayesian());
    return banditSaved && bayesianSaved;
}

LearningStore::LoadReport LearningStore::load(const BlobStore& store) {
    LoadReport report;

    if (auto blob = store.get(BANDIT_KEY)) {
        report.bandit = deserializeBandit(*blob);
    } else {
        report.bandit = LoadResult::failure(LoadResult::NOT_FOUND, "no saved bandit data");
    }

    if (auto blob = store.get(BAYESIAN_KEY)) {
        report.bayesian = deserializeBayesian(*blob);
    } else {
        report.bayesian = LoadResult::failure(LoadResult::NOT_FOUND, "no saved bayesian data");
    }

    return report;
}

bool LearningStore::reset(BlobStore* store) {
    selector_.reset();
    model_.reset();
    if (!store) {
        return true;
    }
    // remove() is false for a key that was never saved
    bool banditCleared = store->remove(BANDIT_KEY) || !store->get(BANDIT_KEY);
    bool bayesianCleared = store->remove(BAYESIAN_KEY) || !store->get(BAYESIAN_KEY);
    return banditCleared && bayesianCleared;
}

LearningStore::PersistenceInfo LearningStore::persistenceInfo(const BlobStore& store) const {
    PersistenceInfo info;
    std::optional<std::string> bandit = store.get(BANDIT_KEY);
    info.hasSavedBanditData = bandit.has_value();
    info.hasSavedBayesianData = store.get(BAYESIAN_KEY).has_value();

    if (bandit) {
        json root = json::parse(*bandit, nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            info.error = "saved bandit data is not valid JSON";
        } else if (root.contains("timestamp") && root.at("timestamp").is_number_integer()) {
            info.lastSavedTimestamp = root.at("timestamp").get<int64_t>();
        }
    }
    return info;
}
