#pragma once

#include "action.hpp"
#include "collision.hpp"
#include "element_placer.hpp"
#include "entity.hpp"
#include "grid.hpp"

#include <memory>
#include <string>
#include <vector>

// A framed scratch grid for arranging draggable art elements.
//
// Each element's whole art box is kept inside the interior
// (1,1)..(height-2,width-2), so the frame can never be overwritten by a drag. Elements may
// overlap each other; later elements draw over earlier ones.
class GridEditor {
public:
    GridEditor(int width, int height, char32_t floor = U'.', const FrameStyle& frame = FrameStyle{});

    const Grid& grid() const { return *grid_; }
    std::shared_ptr<Grid> sharedGrid() const { return grid_; }

    // Returns false when the id is already taken.
    bool addElement(const std::string& elementId, Cell pos, const Art& art);
    bool removeElement(const std::string& elementId);

    size_t elementCount() const { return elements_.size(); }
    const Entity* element(const std::string& elementId) const;

    const Entity* selected() const;
    int selectedIndex() const { return selected_; }
    void selectNext();
    void selectPrevious();

    // Moves the selected element. Blocked when nothing is selected or the
    // move would leave the envelope.
    MoveResult moveSelected(const Cell& delta);

    // Editor command dispatch: movement drags the selection, NextElement and
    // PrevElement cycle it. Returns true when the grid changed.
    bool apply(Action a);

private:
    void eraseDrawn();
    void drawAll();

    std::shared_ptr<Grid> grid_;
    std::vector<Entity> elements_;
    std::vector<std::string> elementIds_; // parallel to elements_
    std::vector<Footprint> drawn_;
    OccupancyIndex occupancy_;
    BlockerSet blockers_;
    int selected_ = 0;
    int nextId_ = 1;
};
