// SEEDFORGE - Mnemonic Word Lists Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/wordlist.h"
#include "seedforge/core/error.h"
#include "seedforge/core/unicode.h"

#include <fstream>

namespace seedforge {
namespace wallet {

// ============================================================================
// WordList Implementation
// ============================================================================

WordList::WordList(std::string name, const std::vector<std::string>& words,
                   std::string separator)
    : name_(ToLowerASCII(name)), separator_(std::move(separator)) {
    if (words.size() != SIZE) {
        throw Error(ErrorCode::InvalidWordList,
                    "Word list '" + name_ + "' has " + std::to_string(words.size()) +
                    " words, expected " + std::to_string(SIZE));
    }

    words_.reserve(SIZE);
    indices_.reserve(SIZE);
    for (size_t i = 0; i < SIZE; ++i) {
        std::string word = NormalizeNFKD(words[i]);
        if (word.empty()) {
            throw Error(ErrorCode::InvalidWordList,
                        "Word list '" + name_ + "' has an empty word at index " +
                        std::to_string(i));
        }
        if (!indices_.emplace(word, static_cast<uint16_t>(i)).second) {
            throw Error(ErrorCode::InvalidWordList,
                        "Word list '" + name_ + "' repeats '" + word + "'");
        }
        words_.push_back(std::move(word));
    }
}

const std::string& WordList::Word(uint32_t index) const {
    if (index >= SIZE) {
        throw Error(ErrorCode::InvalidMnemonic,
                    "Word index " + std::to_string(index) + " out of range");
    }
    return words_[index];
}

std::optional<uint16_t> WordList::Index(const std::string& word) const {
    auto it = indices_.find(word);
    if (it == indices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const WordList& English() {
    static const WordList list(DEFAULT_LANGUAGE,
                               std::vector<std::string>(ENGLISH_WORDS, ENGLISH_WORDS + WordList::SIZE));
    return list;
}

// ============================================================================
// WordListRegistry Implementation
// ============================================================================

WordListRegistry::WordListRegistry() {
    // Share the static English instance; the no-op deleter leaves its
    // lifetime to English()
    lists_[DEFAULT_LANGUAGE] = std::shared_ptr<const WordList>(&English(), [](const WordList*) {});
}

WordListRegistry& WordListRegistry::Default() {
    static WordListRegistry registry;
    return registry;
}

void WordListRegistry::Register(const std::string& name,
                                const std::vector<std::string>& words,
                                const std::string& separator) {
    auto list = std::make_shared<const WordList>(name, words, separator);
    std::lock_guard<std::mutex> lock(mutex_);
    lists_[list->Name()] = std::move(list);
}

void WordListRegistry::RegisterFile(const std::string& name, const std::string& path,
                                    const std::string& separator) {
    std::ifstream in(path);
    if (!in) {
        throw Error(ErrorCode::InvalidWordList, "Cannot read word list file " + path);
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line) && words.size() <= WordList::SIZE) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        words.push_back(line);
    }
    // A trailing newline is not an extra word
    while (!words.empty() && words.back().empty()) {
        words.pop_back();
    }
    Register(name, words, separator);
}

std::shared_ptr<const WordList> WordListRegistry::Select(const std::string& name) const {
    std::string key = ToLowerASCII(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lists_.find(key);
    if (it == lists_.end()) {
        throw Error(ErrorCode::WordListNotFound, "No word list registered for '" + name + "'");
    }
    return it->second;
}

bool WordListRegistry::Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lists_.count(ToLowerASCII(name)) > 0;
}

std::vector<std::string> WordListRegistry::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(lists_.size());
    for (const auto& entry : lists_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string SeparatorFor(const std::string& language) {
    return ToLowerASCII(language) == "japanese" ? JAPANESE_SEPARATOR : " ";
}

} // namespace wallet
} // namespace seedforge
