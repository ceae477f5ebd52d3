#include "uvm/engine/phoneme.hpp"

#include "uvm/engine/encoding.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

namespace uvm::engine {

namespace {

// UTF-8 encoded IPA and romanized symbols.
constexpr std::string_view kConsonants[] = {
    // plosives
    "p", "b", "t", "d", "k", "g", "q", "c",
    // fricatives
    "f", "v", "s", "z", "h", "x",
    "θ", "ð", "ʃ", "ʒ", "ʂ", "ʐ", "ç", "ʜ",
    // affricates
    "tʃ", "dʒ", "ts", "dz",
    // nasals
    "m", "n", "ŋ", "ɲ", "ɳ",
    // liquids
    "l", "r", "ɾ", "ɹ", "ɻ", "ɭ",
    // glides
    "w", "j", "ɥ",
    // japanese bilabial fricative
    "ɸ",
    // romanized clusters that aligners emit as one symbol
    "sh", "ch", "ng",
};

constexpr std::string_view kVowels[] = {
    "a", "e", "i", "o", "u",
    "ə", "ɚ",
    "ɑ", "æ", "ɔ",
    "ɪ", "ʊ", "ʌ",
    "ɛ", "œ", "ø",
    "ɨ", "ʉ", "ɯ", "ɤ", "ɜ", "ɞ", "ɐ",
    "aː", "iː", "uː", "eː", "oː",
};

constexpr std::string_view kLongVowelRomaji[] = {"aa", "ii", "uu", "ee", "oo"};

constexpr std::string_view kConsonantClusters[] = {
    "sh", "ch", "ts", "dz", "ky", "gy", "ny", "hy", "my", "ry", "py", "by",
};

constexpr std::string_view kSilence[] = {
    "sil", "pau", "sp", "ap", "br", "spn", "-", "",
};

constexpr std::string_view kIpaModifiers[] = {
    "ʰ", "ː", "ˑ", "̥", "̪", "̹", "̜",
    "̴", "ʼ", "͡", "͜", "ⁿ", ":",
};

template <std::size_t N>
bool contains(const std::string_view (&table)[N], std::string_view value) {
    return std::find(std::begin(table), std::end(table), value) != std::end(table);
}

bool is_vowel_letter(char ch) {
    return ch == 'a' || ch == 'e' || ch == 'i' || ch == 'o' || ch == 'u';
}

bool is_vowel_like(const std::string& base) {
    if (base.size() == 1 && is_vowel_letter(base[0])) {
        return true;
    }
    return contains(kLongVowelRomaji, base);
}

bool is_consonant_like(const std::string& base) {
    if (base.size() == 1 && std::isalpha(static_cast<unsigned char>(base[0])) && !is_vowel_letter(base[0])) {
        return true;
    }
    return contains(kConsonantClusters, base);
}

std::optional<PhonemeClass> classify_by_table(const std::string& base) {
    if (contains(kConsonants, base) || is_consonant_like(base)) {
        return PhonemeClass::Consonant;
    }
    if (contains(kVowels, base) || is_vowel_like(base)) {
        return PhonemeClass::Vowel;
    }
    return std::nullopt;
}

// ARPAbet-style and merged labels ("AA1", "HH", "ai"): decided by the first letter.
PhonemeClass classify_by_shape(const std::string& base) {
    std::string letters;
    for (const char ch : base) {
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            continue;
        }
        if (!std::isalpha(static_cast<unsigned char>(ch))) {
            return PhonemeClass::Unknown;
        }
        letters += ch;
    }
    if (letters.empty()) {
        return PhonemeClass::Unknown;
    }
    return is_vowel_letter(letters.front()) ? PhonemeClass::Vowel : PhonemeClass::Consonant;
}

}  // namespace

std::string phoneme_base(std::string_view phoneme) {
    auto base = to_lower_ascii(trim(std::string(phoneme)));
    while (true) {
        if (base.ends_with("ː")) {
            base.erase(base.size() - std::string_view("ː").size());
        } else if (base.ends_with(":")) {
            base.pop_back();
        } else {
            break;
        }
    }
    return base;
}

std::string strip_ipa_modifiers(std::string_view phoneme) {
    std::string out = to_lower_ascii(trim(std::string(phoneme)));
    for (const auto modifier : kIpaModifiers) {
        std::size_t pos = 0;
        while ((pos = out.find(modifier, pos)) != std::string::npos) {
            out.erase(pos, modifier.size());
        }
    }
    return out;
}

bool is_silence(std::string_view phoneme) {
    return contains(kSilence, phoneme_base(phoneme));
}

PhonemeClass classify_phoneme(std::string_view phoneme) {
    const auto base = phoneme_base(phoneme);
    if (contains(kSilence, base)) {
        return PhonemeClass::Unknown;
    }
    if (const auto cls = classify_by_table(base)) {
        return *cls;
    }

    // Aspirated or tied symbols ("kʰ", "t͡ʃ") classify as their bare form.
    const auto stripped = strip_ipa_modifiers(base);
    if (stripped != base) {
        if (contains(kSilence, stripped)) {
            return PhonemeClass::Unknown;
        }
        if (const auto cls = classify_by_table(stripped)) {
            return *cls;
        }
    }
    return classify_by_shape(stripped);
}

PhonemeClassification classify_segments(const std::vector<PhonemeSegment>& segments) {
    PhonemeClassification result;
    for (const auto& segment : segments) {
        switch (classify_phoneme(segment.phoneme)) {
            case PhonemeClass::Vowel:
                result.vowels.push_back(segment);
                break;
            case PhonemeClass::Consonant:
                result.consonants.push_back(segment);
                break;
            case PhonemeClass::Unknown:
                result.unknown.push_back(segment);
                break;
        }
    }
    return result;
}

}  // namespace uvm::engine
