#pragma once

#include "uvm/engine/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace uvm::engine {

enum class PhonemeClass {
    Vowel,
    Consonant,
    Unknown,
};

// Lower-cased, trimmed and stripped of trailing length marks (U+02D0 and ':').
std::string phoneme_base(std::string_view phoneme);

// Removes aspiration, length and other IPA diacritics: "kʰ" -> "k", "sː" -> "s".
std::string strip_ipa_modifiers(std::string_view phoneme);

// Symbol tables first, then the single-letter/digraph heuristics, then a
// letter-shape fallback. Silence markers stay Unknown.
PhonemeClass classify_phoneme(std::string_view phoneme);

inline bool is_vowel(std::string_view phoneme) {
    return classify_phoneme(phoneme) == PhonemeClass::Vowel;
}

bool is_silence(std::string_view phoneme);

struct PhonemeClassification {
    std::vector<PhonemeSegment> consonants;
    std::vector<PhonemeSegment> vowels;
    std::vector<PhonemeSegment> unknown;
};

PhonemeClassification classify_segments(const std::vector<PhonemeSegment>& segments);

}  // namespace uvm::engine
