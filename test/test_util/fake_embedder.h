#pragma once

#include <map>
#include <string>

#include <gmock/gmock.h>

#include "mnemo/core/types.h"
#include "mnemo/embedding/embedder.h"

namespace mnemo {
namespace testutil {

// Embeds by table lookup; unknown text maps to the zero vector
class TableEmbedder : public embedding::IEmbedder {
public:
    explicit TableEmbedder(size_t dimension) : dimension_(dimension) {}

    void set(const std::string& text, core::Vector vector) {
        embedding::normalize_in_place(vector);
        table_[text] = std::move(vector);
    }

    core::Vector embed(const std::string& text) const override {
        auto it = table_.find(text);
        if (it == table_.end()) {
            return core::Vector(dimension_, 0.0f);
        }
        return it->second;
    }
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "table"; }

private:
    size_t dimension_;
    std::map<std::string, core::Vector> table_;
};

class MockEmbedder : public embedding::IEmbedder {
public:
    MOCK_METHOD(core::Vector, embed, (const std::string& text), (const, override));
    MOCK_METHOD(size_t, dimension, (), (const, override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

} // namespace testutil
} // namespace mnemo
