#include "index/synonym_index.hpp"
#include "threading/thread_pool.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>

using namespace syn;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_group(const std::set<std::string>& group) {
    std::cout << "  {";
    size_t i = 0;
    for (const auto& word : group) {
        std::cout << word;
        if (++i < group.size()) std::cout << ", ";
    }
    std::cout << "}\n";
}

int main() {
    print_separator("Synonym Index Example - Building Equivalence Classes");

    SynonymIndex index;

    // Example 1: Simple pair
    std::cout << "1. Adding a pair:\n";
    std::cout << "   big <-> large\n";
    index.add("big", "large");

    // Example 2: Words are normalized before they are stored
    std::cout << "\n2. Adding a pair with mixed case and padding:\n";
    std::cout << "   '  Huge ' <-> 'LARGE'\n";
    index.add("  Huge ", "LARGE");

    // Example 3: Several words at once
    std::cout << "\n3. Adding several words at once:\n";
    std::cout << "   [small, little, tiny]\n";
    index.add({"small", "little", "tiny"});

    // Example 4: Bridging two groups merges them
    std::cout << "\n4. Adding [minute, miniature] then bridging with tiny:\n";
    index.add("minute", "miniature");
    index.add("miniature", "tiny");

    print_separator("Queries");

    for (const std::string word : {"big", "TINY", "unknown"}) {
        auto synonyms = index.get(word);
        std::cout << std::left << std::setw(10) << word << "-> ";
        if (synonyms.empty()) {
            std::cout << "(no synonyms)\n";
            continue;
        }
        size_t i = 0;
        for (const auto& synonym : synonyms) {
            std::cout << synonym;
            if (++i < synonyms.size()) std::cout << ", ";
        }
        std::cout << "\n";
    }

    std::cout << "\nAre 'small' and 'minute' synonyms? "
              << (index.are_synonyms("small", "minute") ? "yes" : "no") << "\n";
    std::cout << "Are 'big' and 'tiny' synonyms? "
              << (index.are_synonyms("big", "tiny") ? "yes" : "no") << "\n";

    print_separator("Rejected Input");

    const std::vector<std::vector<std::string>> bad_inputs = {
        {"word", "WORD"},
        {"", "blank"},
        {"alone"},
        {"a", "b", "a"}
    };

    for (const auto& words : bad_inputs) {
        try {
            index.add(words);
            std::cout << "  accepted (unexpected)\n";
        } catch (const std::invalid_argument& e) {
            std::cout << "  rejected: " << e.what() << "\n";
        }
    }

    print_separator("Concurrent Writers");

    {
        ThreadPool pool(4);
        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&index, i]() {
                index.add("color", "colour" + std::to_string(i));
            });
        }
    }  // pool drains and joins here
    std::cout << "Group of 'color' now holds " << index.get("color").size() + 1 << " words\n";

    print_separator("Index Statistics");

    auto stats = index.compute_statistics();
    std::cout << "Number of words: " << stats.num_words << "\n";
    std::cout << "Number of groups: " << stats.num_groups << "\n";
    std::cout << "Largest group: " << stats.largest_group << "\n";
    std::cout << "Next group id: " << stats.next_group_id << "\n";

    print_separator("All Groups (small ones)");

    for (const auto& group : index.get_all()) {
        if (group.size() <= 5) print_group(group);
    }

    print_separator("JSON Export");
    std::cout << stats.to_json().dump(2) << "\n";

    return 0;
}
