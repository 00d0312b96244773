/**
 * @file WorkingMemory.hpp
 * @brief Mémoire de travail : anneau de taille fixe des derniers stimuli
 */

#pragma once

#include "animus/Types.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace animus {

struct WorkingMemoryItem {
    CellContent kind = CellContent::FOOD;   // FOOD, WATER ou OBSTACLE
    GridPos location;
    int tick = 0;
};

class WorkingMemory {
public:
    /// @throws std::invalid_argument si capacity == 0
    explicit WorkingMemory(std::size_t capacity = 5);

    /// Ajoute un élément, écrase le plus ancien si plein
    void push(const WorkingMemoryItem& item);

    /// Éléments satisfaisant pred, du plus récent au plus ancien
    [[nodiscard]] std::vector<WorkingMemoryItem>
    recentMatching(const std::function<bool(const WorkingMemoryItem&)>& pred) const;

    /**
     * @brief Dernier élément de ce type vu dans les window derniers ticks
     */
    [[nodiscard]] std::optional<WorkingMemoryItem>
    recall(CellContent kind, int now, int window) const;

    [[nodiscard]] std::size_t size() const { return full_ ? items_.size() : next_; }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    void clear();

private:
    std::size_t capacity_;
    std::vector<WorkingMemoryItem> items_;
    std::size_t next_ = 0;
    bool full_ = false;
};

} // namespace animus
