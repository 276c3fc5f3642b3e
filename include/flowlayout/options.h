#pragma once

#include "flowlayout/footnotes.h"
#include "flowlayout/geometry.h"
#include <json/json.h>
#include <stdexcept>
#include <string>

namespace flowlayout {

/// Thrown for malformed layout configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Complete set of layout parameters for an IncrementalLayout.
struct LayoutConfig {
    PageGeometry geometry;

    // Footnote band
    float footnoteTopPadding = 4.0f;
    float footnoteDividerHeight = 2.0f;

    // Reserve loop pass budget (pagination passes before the final relayout)
    int maxReservePasses = 4;

    // Measure cache misses concurrently; the MeasureAdapter must then be
    // safe to call from several threads for distinct blocks
    bool parallelMeasure = false;

    FootnoteBandStyle footnoteBandStyle() const {
        return FootnoteBandStyle{footnoteTopPadding, footnoteDividerHeight};
    }
};

/// Read a config object. Keys that are absent keep their defaults:
///
///   { "pageSize": { "w": 612, "h": 792 },
///     "margins": { "top": 72, "right": 72, "bottom": 72, "left": 72 },
///     "footnotes": { "topPadding": 4, "dividerHeight": 2 },
///     "maxReservePasses": 4,
///     "parallelMeasure": false }
///
/// Throws ConfigError on wrongly typed or out-of-range values.
LayoutConfig layoutConfigFromJson(const Json::Value& root);

/// Parse JSON text into a config. Throws ConfigError on syntax errors.
LayoutConfig parseLayoutConfig(const std::string& json);

} // namespace flowlayout
