#pragma once

#include <QColor>
#include <QString>
#include <QVariantMap>

#include "CoreTypes.hpp"

/**
 * @file OverlayStyle.hpp
 * @brief Recognized style options per overlay kind and their validation.
 *
 * Callers pass style as a QVariantMap (e.g. {"border_color": "#00FF00"}).
 * The map is resolved into a typed RectStyle / PointStyle at the
 * widget-capability boundary:
 *  - recognized keys are converted and range-checked, bad values throw
 *    InvalidStyleError
 *  - unknown keys are kept in `extra` (Passthrough) or rejected (Strict)
 */

/**
 * @brief How unknown style keys are treated.
 */
enum class StylePolicy
{
    Passthrough, ///< Keep unknown keys, log a warning.
    Strict       ///< Unknown keys throw InvalidStyleError.
};

/**
 * @brief Label font description (family, point size, bold).
 *
 * Accepted input forms for "label_font":
 *  - a list:   ["Arial", 10, "bold"]
 *  - a string: "Arial,10,bold"
 */
struct FontSpec
{
    QString family    = QStringLiteral("Arial");
    int     pointSize = 10;
    bool    bold      = true;

    bool operator==(const FontSpec&) const = default;
};

struct RectStyle
{
    QColor   borderColor      = QColor(0xFF, 0x00, 0x00);
    int      borderWidth      = 2;
    QColor   background       = QColor(Qt::white);
    QColor   labelBackground  = QColor(0xFF, 0x00, 0x00);
    QColor   labelForeground  = QColor(0xFF, 0xFF, 0xFF);
    FontSpec labelFont        = {};
    double   alpha            = 0.3;
    bool     draggable        = true;
    bool     resizable        = true;
    int      resizeHandleSize = 10;

    /// Unrecognized keys kept under StylePolicy::Passthrough.
    QVariantMap extra = {};
};

struct PointStyle
{
    QColor   pointColor      = QColor(0xFF, 0x00, 0x00);
    int      pointSize       = 8; // radius in pixels
    QColor   labelBackground = QColor(0xFF, 0x00, 0x00);
    QColor   labelForeground = QColor(0xFF, 0xFF, 0xFF);
    FontSpec labelFont       = {};
    double   alpha           = 0.9;
    bool     draggable       = true;
    int      labelOffsetX    = 10;
    int      labelOffsetY    = -25;

    QVariantMap extra = {};
};

namespace OverlayStyle
{

    /**
     * @brief Resolve a rect style map over the rect defaults.
     * @throws InvalidStyleError on a bad value, or an unknown key under Strict.
     */
    RectStyle resolveRect(const QVariantMap& style, StylePolicy policy = StylePolicy::Passthrough);

    /**
     * @brief Resolve a point style map over the point defaults.
     * @throws InvalidStyleError on a bad value, or an unknown key under Strict.
     */
    PointStyle resolvePoint(const QVariantMap& style, StylePolicy policy = StylePolicy::Passthrough);

    /**
     * @brief Validate a style map for the given kind without keeping the result.
     */
    void validate(OverlayKind kind, const QVariantMap& style, StylePolicy policy);

    /**
     * @brief Whether `key` is a recognized option for `kind`.
     */
    [[nodiscard]] bool isRecognized(OverlayKind kind, const QString& key);

    /**
     * @brief Parse a "label_font" value.
     * @throws InvalidStyleError if the value is not a list or string of the accepted form.
     */
    FontSpec parseFont(const QVariant& value);

} // namespace OverlayStyle
