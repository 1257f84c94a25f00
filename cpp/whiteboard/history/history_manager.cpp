#include "whiteboard/history/history_manager.h"
#include "whiteboard/core/logging.h"
#include <utility>

void HistoryManager::undo(Document& doc) {
    auto& history = doc.history;
    if (history.past.empty()) return;

    ShapeMap previous = std::move(history.past.back());
    history.past.pop_back();
    history.future.push_front(std::move(doc.shapes));
    doc.shapes = std::move(previous);
    doc.selection.selectedIds.clear();
    whiteboard::pruneDanglingReferences(doc);
    discardEntry();
    generation_++;
    WHITEBOARD_LOG_DEBUG("undo: past=%zu future=%zu", history.past.size(), history.future.size());
}

void HistoryManager::redo(Document& doc) {
    auto& history = doc.history;
    if (history.future.empty()) return;

    ShapeMap next = std::move(history.future.front());
    history.future.pop_front();
    history.past.push_back(std::move(doc.shapes));
    doc.shapes = std::move(next);
    doc.selection.selectedIds.clear();
    whiteboard::pruneDanglingReferences(doc);
    discardEntry();
    generation_++;
    WHITEBOARD_LOG_DEBUG("redo: past=%zu future=%zu", history.past.size(), history.future.size());
}

bool HistoryManager::beginEntry(const Document& doc) {
    if (transaction_.active) return false;
    transaction_.active = true;
    transaction_.before = doc.shapes;
    return true;
}

void HistoryManager::discardEntry() {
    transaction_.active = false;
    transaction_.before.clear();
}

bool HistoryManager::rollbackEntry(Document& doc) {
    if (!transaction_.active) return false;
    doc.shapes = std::move(transaction_.before);
    discardEntry();
    whiteboard::pruneDanglingReferences(doc);
    return true;
}

bool HistoryManager::commitEntry(Document& doc) {
    if (!transaction_.active) return false;
    ShapeMap before = std::move(transaction_.before);
    discardEntry();
    return commit(doc, std::move(before));
}

bool HistoryManager::commit(Document& doc, ShapeMap before) {
    if (before == doc.shapes) {
        return false;
    }
    push(doc, std::move(before));
    return true;
}

void HistoryManager::invalidateRedo(Document& doc) {
    if (doc.history.future.empty()) return;
    doc.history.future.clear();
    generation_++;
}

void HistoryManager::reset() noexcept {
    transaction_.active = false;
    transaction_.before.clear();
    generation_ = 0;
}

void HistoryManager::push(Document& doc, ShapeMap&& before) {
    doc.history.past.push_back(std::move(before));
    doc.history.future.clear();
    generation_++;
}
