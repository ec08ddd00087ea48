#include "editor.hpp"

#include <algorithm>
#include <utility>

GridEditor::GridEditor(int width, int height, char32_t floor, const FrameStyle& frame)
    : grid_(std::make_shared<Grid>(width, height, floor)) {
    grid_->drawFrame(floor, frame);
    occupancy_.reset(grid_->width(), grid_->height());
}

bool GridEditor::addElement(const std::string& elementId, Cell pos, const Art& art) {
    if (std::find(elementIds_.begin(), elementIds_.end(), elementId) != elementIds_.end()) return false;

    Entity e = makeEntity(0, EntityKind::Element, grid_, pos);
    e.name = elementId;
    if (!art.empty()) e.art = art;

    // The whole art box has to stay inside the frame.
    const int artH = std::max(1, e.art.height());
    const int artW = std::max(1, e.art.width());
    const CellRect inside{ 1, 1, grid_->height() - 1 - artH, grid_->width() - 1 - artW };
    if (!inside.contains(pos)) return false;
    e.bounds = inside;
    e.id = nextId_++;

    eraseDrawn();
    elements_.push_back(std::move(e));
    elementIds_.push_back(elementId);
    drawAll();
    return true;
}

bool GridEditor::removeElement(const std::string& elementId) {
    auto it = std::find(elementIds_.begin(), elementIds_.end(), elementId);
    if (it == elementIds_.end()) return false;
    const auto i = it - elementIds_.begin();

    eraseDrawn();
    elements_.erase(elements_.begin() + i);
    elementIds_.erase(it);
    drawAll();

    if (selected_ >= static_cast<int>(elements_.size())) {
        selected_ = std::max(0, static_cast<int>(elements_.size()) - 1);
    }
    return true;
}

const Entity* GridEditor::element(const std::string& elementId) const {
    for (size_t i = 0; i < elementIds_.size(); ++i) {
        if (elementIds_[i] == elementId) return &elements_[i];
    }
    return nullptr;
}

const Entity* GridEditor::selected() const {
    if (selected_ >= 0 && selected_ < static_cast<int>(elements_.size())) {
        return &elements_[static_cast<size_t>(selected_)];
    }
    return nullptr;
}

void GridEditor::selectNext() {
    if (elements_.empty()) return;
    selected_ = (selected_ + 1) % static_cast<int>(elements_.size());
}

void GridEditor::selectPrevious() {
    if (elements_.empty()) return;
    const int n = static_cast<int>(elements_.size());
    selected_ = (selected_ - 1 + n) % n;
}

MoveResult GridEditor::moveSelected(const Cell& delta) {
    if (!selected()) return MoveResult::Blocked;
    Entity& e = elements_[static_cast<size_t>(selected_)];

    const MoveResult r = attemptMove(e, delta, blockers_, occupancy_);
    if (r == MoveResult::Moved) {
        eraseDrawn();
        drawAll();
    }
    return r;
}

bool GridEditor::apply(Action a) {
    switch (a) {
        case Action::NextElement:
            selectNext();
            return false;
        case Action::PrevElement:
            selectPrevious();
            return false;
        default:
            break;
    }
    if (!isMoveAction(a)) return false;
    return moveSelected(actionDelta(a)) == MoveResult::Moved;
}

void GridEditor::eraseDrawn() {
    removeAll(*grid_, drawn_);
    drawn_.clear();
    occupancy_.clear();
}

void GridEditor::drawAll() {
    std::vector<const Entity*> order;
    order.reserve(elements_.size());
    for (const Entity& e : elements_) order.push_back(&e);

    drawn_ = placeAll(*grid_, order);
    for (size_t i = 0; i < drawn_.size(); ++i) occupancy_.insert(elements_[i], drawn_[i]);
}
