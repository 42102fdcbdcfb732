#include "mnemo/embedding/embedder.h"

#include <cctype>
#include <cmath>

#include "mnemo/core/error.h"

namespace mnemo {
namespace embedding {

namespace {

const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

} // namespace

FeatureEmbedder::FeatureEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw core::InvalidArgumentError("Embedding dimension must be greater than 0");
    }
}

const std::vector<std::string>& FeatureEmbedder::keywords() {
    static const std::vector<std::string> kKeywords = {
        "project", "requirement", "design", "implement", "test",
        "deploy", "issue", "solution", "learning", "decision",
        "\xe9\xa1\xb9\xe7\x9b\xae",   // project
        "\xe9\x9c\x80\xe6\xb1\x82",   // requirement
        "\xe8\xae\xbe\xe8\xae\xa1",   // design
        "\xe5\xae\x9e\xe7\x8e\xb0",   // implement
        "\xe6\xb5\x8b\xe8\xaf\x95",   // test
        "\xe9\x83\xa8\xe7\xbd\xb2",   // deploy
        "\xe9\x97\xae\xe9\xa2\x98",   // issue
        "\xe8\xa7\xa3\xe5\x86\xb3",   // solve
        "\xe5\xad\xa6\xe4\xb9\xa0",   // learn
        "\xe5\x86\xb3\xe7\xad\x96"    // decide
    };
    return kKeywords;
}

core::Vector FeatureEmbedder::embed(const std::string& text) const {
    core::Vector vector(dimension_, 0.0f);

    std::string lowered(text);
    for (auto& ch : lowered) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            ch = static_cast<char>(std::tolower(c));
        }
    }

    size_t counts[256] = {0};
    for (unsigned char c : lowered) {
        ++counts[c];
    }
    for (size_t i = 0; i < kCharFeatureCount && i < dimension_; ++i) {
        vector[i] = static_cast<float>(counts[static_cast<unsigned char>(kAlphabet[i])]);
    }

    if (dimension_ > kWordCountFeature) {
        vector[kLengthFeature] = static_cast<float>(text.size());
        vector[kWordCountFeature] = static_cast<float>(count_words(text));
    }

    const auto& words = keywords();
    for (size_t i = 0; i < words.size() && kKeywordOffset + i < dimension_; ++i) {
        vector[kKeywordOffset + i] = static_cast<float>(count_occurrences(lowered, words[i]));
    }

    normalize_in_place(vector);
    return vector;
}

double l2_norm(const core::Vector& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * static_cast<double>(x);
    }
    return std::sqrt(sum);
}

void normalize_in_place(core::Vector& v) {
    double norm = l2_norm(v);
    if (norm <= 0.0 || !std::isfinite(norm)) {
        return;
    }
    for (auto& x : v) {
        x = static_cast<float>(static_cast<double>(x) / norm);
    }
}

double cosine_similarity(const core::Vector& a, const core::Vector& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

} // namespace embedding
} // namespace mnemo
