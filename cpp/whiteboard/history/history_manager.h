#pragma once

#include "whiteboard/document/document.h"
#include <cstddef>
#include <cstdint>

// Snapshot-based undo/redo over Document::shapes.
//
// Interactive gestures open an entry with beginEntry() when they start and
// close it with commitEntry() when they end, so a whole stroke or drag is a
// single undo step. One-shot actions use commit() with the pre-action shapes.
class HistoryManager {
public:
    bool canUndo(const Document& doc) const noexcept { return !doc.history.past.empty(); }
    bool canRedo(const Document& doc) const noexcept { return !doc.history.future.empty(); }

    void undo(Document& doc);
    void redo(Document& doc);

    // Transaction management
    bool beginEntry(const Document& doc);
    void discardEntry();
    // Restores the shapes captured by beginEntry() and closes the entry.
    bool rollbackEntry(Document& doc);
    bool commitEntry(Document& doc);
    bool isTransactionActive() const noexcept { return transaction_.active; }

    // Pushes `before` if it differs from the current shapes.
    bool commit(Document& doc, ShapeMap before);

    // Shapes changed outside a commit; redo history no longer applies.
    void invalidateRedo(Document& doc);

    void reset() noexcept;

    std::uint32_t getGeneration() const noexcept { return generation_; }

private:
    void push(Document& doc, ShapeMap&& before);

    struct Transaction {
        bool active = false;
        ShapeMap before;
    };

    Transaction transaction_;
    std::uint32_t generation_ = 0;
};
