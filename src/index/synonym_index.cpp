#include "index/synonym_index.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace syn {

// ==========================================
// IndexStatistics Implementation
// ==========================================

nlohmann::json IndexStatistics::to_json() const {
    nlohmann::json j;
    j["num_words"] = num_words;
    j["num_groups"] = num_groups;
    j["largest_group"] = largest_group;
    j["next_group_id"] = next_group_id;
    return j;
}

// ==========================================
// Normalization and validation
// ==========================================

std::string SynonymIndex::normalize_word(const std::string& word) {
    size_t start = 0;
    while (start < word.size() && std::isspace(static_cast<unsigned char>(word[start]))) {
        ++start;
    }

    size_t end = word.size();
    while (end > start && std::isspace(static_cast<unsigned char>(word[end - 1]))) {
        --end;
    }

    std::string result;
    result.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(word[i])));
    }
    return result;
}

std::pair<std::string, std::string> SynonymIndex::canonical_pair(
    const std::string& word1,
    const std::string& word2
) {
    std::string w1 = normalize_word(word1);
    std::string w2 = normalize_word(word2);

    if (w1.empty() || w2.empty()) {
        throw std::invalid_argument("Words cannot be empty nor blank");
    }
    if (w1 == w2) {
        throw std::invalid_argument("A word cannot be a synonym of itself");
    }

    return {std::move(w1), std::move(w2)};
}

// ==========================================
// Mutation
// ==========================================

void SynonymIndex::add(const std::string& word1, const std::string& word2) {
    auto [w1, w2] = canonical_pair(word1, word2);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it1 = word_to_group_.find(w1);
    auto it2 = word_to_group_.find(w2);
    bool has1 = it1 != word_to_group_.end();
    bool has2 = it2 != word_to_group_.end();

    if (!has1 && !has2) {
        insert(w1, w2);
    } else if (has1 && !has2) {
        link(it1->second, w2);
    } else if (!has1) {
        link(it2->second, w1);
    } else if (it1->second != it2->second) {
        relink(it1->second, it2->second);
    }
    // Same group already: nothing to do
}

void SynonymIndex::add(const std::vector<std::string>& words) {
    if (words.size() < 2) {
        throw std::invalid_argument("At least two words must be passed");
    }

    std::vector<std::string> canonical;
    canonical.reserve(words.size());
    for (const auto& word : words) {
        std::string w = normalize_word(word);
        if (w.empty()) {
            throw std::invalid_argument("Words cannot be empty nor blank");
        }
        canonical.push_back(std::move(w));
    }

    std::set<std::string> unique(canonical.begin(), canonical.end());
    if (unique.size() != canonical.size()) {
        throw std::invalid_argument("Words contain duplicates");
    }

    for (size_t i = 0; i + 1 < canonical.size(); ++i) {
        add(canonical[i], canonical[i + 1]);
    }
}

void SynonymIndex::add(std::initializer_list<std::string> words) {
    add(std::vector<std::string>(words));
}

void SynonymIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    word_to_group_.clear();
    group_to_words_.clear();
}

SynonymIndex::GroupId SynonymIndex::next_group_id() {
    return ++sequence_;
}

void SynonymIndex::insert(const std::string& word1, const std::string& word2) {
    GroupId group = next_group_id();
    link(group, word1);
    link(group, word2);
}

void SynonymIndex::link(GroupId group, const std::string& word) {
    word_to_group_[word] = group;
    group_to_words_[group].insert(word);
}

void SynonymIndex::relink(GroupId group1, GroupId group2) {
    auto node1 = group_to_words_.extract(group1);
    auto node2 = group_to_words_.extract(group2);

    std::set<std::string>& merged = node1.mapped();
    merged.merge(node2.mapped());

    GroupId group = next_group_id();
    for (const auto& word : merged) {
        word_to_group_[word] = group;
    }

    node1.key() = group;
    group_to_words_.insert(std::move(node1));
}

// ==========================================
// Queries
// ==========================================

std::set<std::string> SynonymIndex::get(const std::string& word) const {
    std::string w = normalize_word(word);

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = word_to_group_.find(w);
    if (it == word_to_group_.end()) {
        return {};
    }

    std::set<std::string> result = group_to_words_.at(it->second);
    result.erase(w);
    return result;
}

std::vector<std::set<std::string>> SynonymIndex::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::set<std::string>> groups;
    groups.reserve(group_to_words_.size());
    for (const auto& [id, words] : group_to_words_) {
        groups.push_back(words);
    }
    return groups;
}

bool SynonymIndex::contains(const std::string& word) const {
    std::string w = normalize_word(word);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return word_to_group_.count(w) > 0;
}

bool SynonymIndex::are_synonyms(const std::string& word1, const std::string& word2) const {
    std::string w1 = normalize_word(word1);
    std::string w2 = normalize_word(word2);
    if (w1 == w2) return false;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it1 = word_to_group_.find(w1);
    auto it2 = word_to_group_.find(w2);
    if (it1 == word_to_group_.end() || it2 == word_to_group_.end()) {
        return false;
    }
    return it1->second == it2->second;
}

size_t SynonymIndex::num_words() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return word_to_group_.size();
}

size_t SynonymIndex::num_groups() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return group_to_words_.size();
}

bool SynonymIndex::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return word_to_group_.empty();
}

IndexStatistics SynonymIndex::compute_statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    IndexStatistics stats;
    stats.num_words = word_to_group_.size();
    stats.num_groups = group_to_words_.size();
    stats.next_group_id = sequence_ + 1;
    for (const auto& [id, words] : group_to_words_) {
        stats.largest_group = std::max(stats.largest_group, words.size());
    }
    return stats;
}

nlohmann::json SynonymIndex::to_json() const {
    auto groups = get_all();
    std::sort(groups.begin(), groups.end());

    nlohmann::json j;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& group : groups) {
        arr.push_back(std::vector<std::string>(group.begin(), group.end()));
    }
    j["groups"] = arr;
    return j;
}

} // namespace syn
