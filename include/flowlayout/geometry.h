#pragma once

namespace flowlayout {

/// Page dimensions in the measurement adapter's unit
struct PageSize {
    float w = 612.0f;    // US Letter at 72 units per inch
    float h = 792.0f;
};

/// Page margins
struct Margins {
    float top = 72.0f;
    float right = 72.0f;
    float bottom = 72.0f;
    float left = 72.0f;
};

/// Size + margins of a page. Section breaks may switch to a new geometry
/// for the pages that follow them.
struct PageGeometry {
    PageSize size;
    Margins margins;

    /// Available content width given the page width
    float contentWidth() const {
        return size.w - margins.left - margins.right;
    }

    /// Available content height before any footnote reservation
    float contentHeight() const {
        return size.h - margins.top - margins.bottom;
    }
};

} // namespace flowlayout
