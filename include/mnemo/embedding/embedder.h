#ifndef MNEMO_EMBEDDING_EMBEDDER_H_
#define MNEMO_EMBEDDING_EMBEDDER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "mnemo/core/types.h"

namespace mnemo {
namespace embedding {

/**
 * @brief Text to fixed-length vector capability
 *
 * Implementations must be deterministic and total: identical text yields a
 * bit-identical vector of exactly dimension() components, and no input
 * (including the empty string) fails. Returned vectors are L2-normalized,
 * or all zeros for degenerate text.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    virtual core::Vector embed(const std::string& text) const = 0;
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Reference embedder built from hand-picked text features
 *
 * Layout:
 *   [0, 36)  frequency of a-z and 0-9 in the ASCII-lower-cased text
 *   36       text length in bytes
 *   37       whitespace separated word count
 *   [38, ..) occurrence count of each domain keyword
 *
 * Features past the configured dimension are dropped, unused slots stay
 * zero, then the whole vector is L2-normalized.
 */
class FeatureEmbedder : public IEmbedder {
public:
    static constexpr size_t kDefaultDimension = 384;
    static constexpr size_t kCharFeatureCount = 36;
    static constexpr size_t kLengthFeature = 36;
    static constexpr size_t kWordCountFeature = 37;
    static constexpr size_t kKeywordOffset = 38;

    explicit FeatureEmbedder(size_t dimension = kDefaultDimension);

    core::Vector embed(const std::string& text) const override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "feature"; }

    static const std::vector<std::string>& keywords();

private:
    size_t dimension_;
};

// Vector math shared by the index and the tests
double l2_norm(const core::Vector& v);
void normalize_in_place(core::Vector& v);

/**
 * @brief Cosine similarity; 0 when either vector has zero norm or the
 * dimensions differ
 */
double cosine_similarity(const core::Vector& a, const core::Vector& b);

} // namespace embedding
} // namespace mnemo

#endif // MNEMO_EMBEDDING_EMBEDDER_H_
