// SEEDFORGE - Mnemonic Word Lists
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// A word list is an immutable, named vocabulary of exactly 2048 NFKD words
// addressed by 11-bit index. Lists are registered by language name and
// handed to the mnemonic codec explicitly; there is no process-wide
// "active" list.

#ifndef SEEDFORGE_WALLET_WORDLIST_H
#define SEEDFORGE_WALLET_WORDLIST_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedforge {
namespace wallet {

// ============================================================================
// Word List
// ============================================================================

class WordList {
public:
    /// Number of words in every list
    static constexpr size_t SIZE = 2048;

    /// Bits encoded by one word
    static constexpr int INDEX_BITS = 11;

    /**
     * Build a list. Every word is NFKD-normalized.
     *
     * @param name Language name (stored lower-cased)
     * @param words Exactly SIZE distinct, non-empty words
     * @param separator Joins words into a sentence (U+3000 for Japanese)
     * @throws Error(InvalidWordList)
     */
    WordList(std::string name, const std::vector<std::string>& words,
             std::string separator = " ");

    const std::string& Name() const { return name_; }
    const std::string& Separator() const { return separator_; }

    /// Word at index
    /// @throws Error(InvalidMnemonic) if index >= SIZE
    const std::string& Word(uint32_t index) const;

    /// Index of word, or nullopt if absent. The word is matched as given;
    /// callers normalize before lookup.
    std::optional<uint16_t> Index(const std::string& word) const;

    bool Contains(const std::string& word) const { return Index(word).has_value(); }

private:
    std::string name_;
    std::string separator_;
    std::vector<std::string> words_;
    std::unordered_map<std::string, uint16_t> indices_;
};

/// The BIP-39 English list
const WordList& English();

/// Raw English table, SIZE entries
extern const char* const ENGLISH_WORDS[WordList::SIZE];

// ============================================================================
// Word List Registry
// ============================================================================

/**
 * Maps language names to word lists.
 *
 * Names are case-insensitive. English is registered on construction.
 * Registration and lookup are thread-safe; a selected list is an immutable
 * shared value, so it stays valid if the registry entry is later replaced.
 */
class WordListRegistry {
public:
    WordListRegistry();

    /// Process-wide registry
    static WordListRegistry& Default();

    /**
     * Register (or replace) a list under name.
     *
     * @throws Error(InvalidWordList) if the list is malformed
     */
    void Register(const std::string& name, const std::vector<std::string>& words,
                  const std::string& separator = " ");

    /**
     * Register a list read from a text file with one word per line, in
     * index order (the format of the published BIP-39 lists).
     *
     * @throws Error(InvalidWordList) if the file cannot be read or the
     *         list is malformed
     */
    void RegisterFile(const std::string& name, const std::string& path,
                      const std::string& separator);

    /**
     * Select a registered list by name.
     *
     * @throws Error(WordListNotFound) if name is not registered
     */
    std::shared_ptr<const WordList> Select(const std::string& name) const;

    bool Contains(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> Names() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const WordList>> lists_;
};

/// Language selected when none is configured
constexpr const char* DEFAULT_LANGUAGE = "english";

/// U+3000 IDEOGRAPHIC SPACE, which joins Japanese sentences
constexpr const char* JAPANESE_SEPARATOR = "\xE3\x80\x80";

/// JAPANESE_SEPARATOR for "japanese", a plain space otherwise
std::string SeparatorFor(const std::string& language);

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_WORDLIST_H
