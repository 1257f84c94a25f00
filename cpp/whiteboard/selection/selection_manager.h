#pragma once

#include "whiteboard/document/document.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Selection, marquee and group-drag rules over a Document.
class SelectionManager {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    void setSelection(Document& doc, const std::vector<std::string>& ids, Mode mode);
    void clearSelection(Document& doc);

    // Click on a shape: shift toggles membership, otherwise the shape becomes the selection.
    void selectByClick(Document& doc, const std::string& id, bool shift);

    // Ids whose bounds overlap `box`.
    std::vector<std::string> queryMarquee(const Document& doc, const Box& box) const;

    void beginMarquee(Document& doc, const Point2& world, bool shift);
    void updateMarquee(Document& doc, const Point2& world);
    // Selects what the marquee touched, unioned with the prior selection when `shift`.
    void finishMarquee(Document& doc, bool shift);
    std::optional<Box> marqueeBox(const Document& doc) const;

    std::optional<Box> groupBounds(const Document& doc) const;

    // Group drag needs >=2 selected shapes and `world` inside their union bounds.
    bool canBeginGroupDrag(const Document& doc, const Point2& world) const;
    void beginGroupDrag(Document& doc, const Point2& world);
    // geometry = snapshot + (world - startPoint)
    void updateGroupDrag(Document& doc, const Point2& world);
    void endGroupDrag(Document& doc);

    std::uint32_t getGeneration() const noexcept { return generation_; }

private:
    std::uint32_t generation_ = 0;
};
