#include "board.hpp"
#include "../events.hpp"

using namespace ecs;
using xiangqi::layout::Cell;

SelectAction BoardSystem::apply_click(BoardView& view, Cell cell, Cell& out_from) {
    if (!view.selected) {
        view.selected = cell;
        out_from      = cell;
        return SelectAction::Selected;
    }

    out_from = *view.selected;
    view.selected.reset();
    return same_cell(out_from, cell) ? SelectAction::Deselected : SelectAction::Moved;
}

void BoardSystem::Update(World& world, float /*dt*/) {
    auto* view   = world.try_resource<BoardView>();
    auto* clicks = world.try_resource<Events<BoardClickEvent>>();
    auto* out    = world.try_resource<Events<PieceActionEvent>>();
    if (!view || !clicks || !out) return;

    for (const auto& ev : clicks->read()) {
        Cell to{ev.row, ev.col};
        Cell from{};
        SelectAction action = apply_click(*view, to, from);
        out->send({action, from, to, ev.x, ev.y});
    }
}
