// =====================================================================
//  src/libtakeoff/takeoff/measure/parsing.h — Distance text parsing
// =====================================================================
//
//  Parses the human-entered distances used by calibration and the
//  architectural drawing scales printed on blueprints.  Unrecognized
//  text is always reported as invalid; a value is never guessed.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_MEASURE_PARSING_H
#define TAKEOFF_MEASURE_PARSING_H

#include "../core.h"
#include "../geometry/types.h"

#include <QPointF>
#include <QString>
#include <QStringList>

#include <optional>

namespace takeoff {
namespace measure {

// =====================================================================
//  Distance Parsing
// =====================================================================

/// Which textual form a distance was written in
enum class DistanceFormat {
    Invalid,
    Decimal,         ///< "11.33"
    FeetInchesMark,  ///< "11'4\"", "11' 4\"", "11'4", "11'"
    InchesMark,      ///< "4\""
    FeetInchesDash,  ///< "11-4"
    FeetInchesSpace  ///< "11 4"
};

/// Result of parsing a distance string
struct ParsedDistance {
    bool valid = false;          ///< Whether parsing succeeded
    double value = 0.0;          ///< feet + inches / 12 (or the plain decimal)
    DistanceFormat format = DistanceFormat::Invalid;
    QString error;               ///< User-facing message when invalid
};

/// Parse a distance string.
///
/// Examples:
/// - "11.33"   -> 11.33
/// - "11'4\""  -> 11.3333
/// - "11' 4\"" -> 11.3333
/// - "11-4"    -> 11.3333
/// - "11 4"    -> 11.3333
/// - "6\""     -> 0.5
///
/// Inches of 12 or more carry into feet: "11-12" -> 12.0.
/// A leading sign is accepted on plain decimals only, so that "-3"
/// parses (and is later rejected as non-positive) instead of being
/// misread as feet-and-inches.
TAKEOFF_EXPORT ParsedDistance parseDistance(const QString& text);

// =====================================================================
//  Drawing Scale Parsing
// =====================================================================

/// Default raster resolution assumed for scanned drawings
constexpr double DEFAULT_DPI = 96.0;

/// Result of parsing a printed drawing scale
struct ParsedDrawingScale {
    bool valid = false;
    double inchesPerFoot = 0.0;  ///< Paper inches per real-world foot
    QString error;
};

/// Parse an architectural or ratio drawing scale.
///
/// Examples:
/// - "1/4\" = 1'"      -> 0.25
/// - "1/4\" = 1'-0\""  -> 0.25
/// - "1 1/2\" = 1'"    -> 1.5
/// - "1\" = 10'"       -> 0.1
/// - "1:48"            -> 0.25
TAKEOFF_EXPORT ParsedDrawingScale parseDrawingScale(const QString& text);

/// Pixels per real-world foot for a drawing scale rasterized at dpi.
/// Returns 0 for non-positive input.
TAKEOFF_EXPORT double pixelsPerFootFromDrawingScale(
    double inchesPerFoot,
    double dpi = DEFAULT_DPI);

/// Parse an inch quantity: "3", "0.25", "1/4", "1 1/2", "1-1/2".
/// Returns false if the text is not such a quantity.
TAKEOFF_EXPORT bool parseInchQuantity(const QString& text, double& inches);

// =====================================================================
//  Coordinate Parsing
// =====================================================================

/// Parse a pixel coordinate "x,y" (whitespace around the comma allowed)
TAKEOFF_EXPORT std::optional<QPointF> parsePoint(const QString& text);

/// Parse a vertex list given as separate "x,y" tokens, or as one token
/// with points separated by ';'.  Returns nullopt if any point is
/// invalid.
TAKEOFF_EXPORT std::optional<geometry::VertexSequence> parsePointList(
    const QStringList& tokens);

}  // namespace measure
}  // namespace takeoff

#endif  // TAKEOFF_MEASURE_PARSING_H
