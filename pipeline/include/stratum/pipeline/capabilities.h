#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "stratum/frontend/syntax.h"

namespace stratum::pipeline {

// Turns a syntax node into a record, or nullopt when the node is of another
// kind.
template <typename T>
class NodeMapper {
   public:
    virtual ~NodeMapper() = default;
    [[nodiscard]] virtual auto map(const frontend::SyntaxNode& node) const -> std::optional<T> = 0;
};

template <typename T>
class ItemValidator {
   public:
    virtual ~ItemValidator() = default;
    [[nodiscard]] virtual auto isValid(const T& item) const -> bool = 0;
};

template <typename T>
class ResultCollector {
   public:
    virtual ~ResultCollector() = default;
    virtual void collect(T item) = 0;
    [[nodiscard]] virtual auto results() const -> const std::vector<T>& = 0;
};

// One human-readable entry; empty means the item is not shown.
template <typename T>
class ItemRenderer {
   public:
    virtual ~ItemRenderer() = default;
    [[nodiscard]] virtual auto render(const T& item) const -> std::string = 0;
};

template <typename T>
class VectorCollector final : public ResultCollector<T> {
   public:
    void collect(T item) override { items_.push_back(std::move(item)); }
    [[nodiscard]] auto results() const -> const std::vector<T>& override { return items_; }

   private:
    std::vector<T> items_;
};

}  // namespace stratum::pipeline
