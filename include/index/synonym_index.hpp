#ifndef SYNONYM_INDEX_HPP
#define SYNONYM_INDEX_HPP

#include <string>
#include <vector>
#include <set>
#include <unordered_map>
#include <initializer_list>
#include <shared_mutex>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace syn {

/**
 * @brief Statistics about the partition held by a SynonymIndex
 */
struct IndexStatistics {
    size_t num_words = 0;
    size_t num_groups = 0;
    size_t largest_group = 0;
    std::uint64_t next_group_id = 0;     // Id the next created group will receive

    nlohmann::json to_json() const;
};

/**
 * @brief Thread-safe dictionary of synonym groups (equivalence classes of words)
 *
 * Every word is stored in its canonical form (trimmed, lowercase) and belongs
 * to exactly one group. Adding a pair merges the groups of both words.
 *
 * Two maps describe the partition:
 * - word -> group id
 * - group id -> member words
 *
 * Both maps and the group id sequence are guarded by one reader/writer lock.
 * Mutations hold the exclusive lock for their whole multi-step update, reads
 * hold the shared lock and return copies, so a reader never sees a group in
 * the middle of a merge.
 */
class SynonymIndex {
public:
    using GroupId = std::uint64_t;

    SynonymIndex() = default;

    SynonymIndex(const SynonymIndex&) = delete;
    SynonymIndex& operator=(const SynonymIndex&) = delete;

    // ==========================================
    // Mutation
    // ==========================================

    /**
     * @brief Add two words as synonyms
     * @throws std::invalid_argument if a word is blank or both words are the same
     *
     * Creates a group, extends one, or merges two groups into a freshly
     * allocated group id. Adding an existing pair again is a no-op.
     */
    void add(const std::string& word1, const std::string& word2);

    /**
     * @brief Add all words as synonyms of each other
     * @throws std::invalid_argument if fewer than two words are passed,
     *         a word is blank, or the words contain duplicates
     *
     * Links each word to the next one in the given order. Validation is done
     * up front, a rejected call leaves the index untouched.
     */
    void add(const std::vector<std::string>& words);
    void add(std::initializer_list<std::string> words);

    /**
     * @brief Remove every word and group
     *
     * The group id sequence keeps counting, ids are never handed out twice.
     */
    void clear();

    // ==========================================
    // Queries (copies taken under the shared lock)
    // ==========================================

    /**
     * @brief Get the synonyms of a word, excluding the word itself
     * @return Empty set if the word is unknown
     */
    std::set<std::string> get(const std::string& word) const;

    /**
     * @brief Get every synonym group
     *
     * Order of the groups is unspecified.
     */
    std::vector<std::set<std::string>> get_all() const;

    bool contains(const std::string& word) const;

    bool are_synonyms(const std::string& word1, const std::string& word2) const;

    size_t num_words() const;
    size_t num_groups() const;
    bool empty() const;

    IndexStatistics compute_statistics() const;

    /**
     * @brief Export the partition as {"groups": [[...], ...]}
     *
     * Words inside a group and the groups themselves are sorted so the output
     * is stable for a given partition.
     */
    nlohmann::json to_json() const;

    /**
     * @brief Canonical form of a word: whitespace trimmed, lowercased
     */
    static std::string normalize_word(const std::string& word);

private:
    std::unordered_map<std::string, GroupId> word_to_group_;
    std::unordered_map<GroupId, std::set<std::string>> group_to_words_;
    GroupId sequence_ = 0;

    mutable std::shared_mutex mutex_;

    // The helpers below expect the exclusive lock to be held

    GroupId next_group_id();

    // Create a new group holding both words
    void insert(const std::string& word1, const std::string& word2);

    // Attach a word to an existing group
    void link(GroupId group, const std::string& word);

    // Dissolve both groups into one with a fresh id
    void relink(GroupId group1, GroupId group2);

    // Validates and canonicalizes a pair, throws std::invalid_argument
    static std::pair<std::string, std::string> canonical_pair(
        const std::string& word1,
        const std::string& word2
    );
};

} // namespace syn

#endif // SYNONYM_INDEX_HPP
