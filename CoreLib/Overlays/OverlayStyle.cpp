#include "OverlayStyle.hpp"

#include <QDebug>
#include <QStringList>
#include <climits>
#include <functional>
#include <string>
#include <vector>

#include "OverlayErrors.hpp"

namespace
{
    [[noreturn]] static void fail(OverlayKind kind, const QString& key, const QString& why)
    {
        const std::string msg = "OverlayStyle: " + std::string(kindName(kind)) + " option \"" +
                                key.toStdString() + "\" " + why.toStdString();
        throw InvalidStyleError(msg);
    }

    static QColor toColor(OverlayKind kind, const QString& key, const QVariant& v)
    {
        if (v.typeId() == QMetaType::QColor)
        {
            QColor c = v.value<QColor>();
            if (!c.isValid())
                fail(kind, key, "is an invalid color");
            return c;
        }

        if (v.typeId() != QMetaType::QString && v.typeId() != QMetaType::QByteArray)
            fail(kind, key, "must be a color name or #RRGGBB string");

        QColor c(v.toString());
        if (!c.isValid())
            fail(kind, key, "is not a valid color: " + v.toString());
        return c;
    }

    static int toInt(OverlayKind kind, const QString& key, const QVariant& v, int minValue)
    {
        bool ok    = false;
        int  value = v.toInt(&ok);
        if (!ok || v.typeId() == QMetaType::Bool)
            fail(kind, key, "must be an integer");
        if (value < minValue)
            fail(kind, key, QStringLiteral("must be >= %1").arg(minValue));
        return value;
    }

    static double toUnitDouble(OverlayKind kind, const QString& key, const QVariant& v)
    {
        bool   ok    = false;
        double value = v.toDouble(&ok);
        if (!ok || v.typeId() == QMetaType::Bool)
            fail(kind, key, "must be a number");
        if (value < 0.0 || value > 1.0)
            fail(kind, key, "must be within [0, 1]");
        return value;
    }

    static bool toBool(OverlayKind kind, const QString& key, const QVariant& v)
    {
        if (v.typeId() == QMetaType::Bool)
            return v.toBool();

        bool ok    = false;
        int  value = v.toInt(&ok);
        if (ok && (value == 0 || value == 1))
            return value == 1;

        fail(kind, key, "must be a boolean");
    }

    template<typename Style>
    struct StyleOption
    {
        const char*                                                               key;
        std::function<void(Style&, OverlayKind, const QString&, const QVariant&)> apply;
    };

    static const std::vector<StyleOption<RectStyle>>& rectOptions()
    {
        static const std::vector<StyleOption<RectStyle>> options = {
            {"border_color", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.borderColor = toColor(k, n, v); }},
            {"border_width", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.borderWidth = toInt(k, n, v, 0); }},
            {"bg_color", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.background = toColor(k, n, v); }},
            {"label_bg", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelBackground = toColor(k, n, v); }},
            {"label_fg", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelForeground = toColor(k, n, v); }},
            {"label_font", [](RectStyle& s, OverlayKind, const QString&, const QVariant& v) { s.labelFont = OverlayStyle::parseFont(v); }},
            {"alpha", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.alpha = toUnitDouble(k, n, v); }},
            {"draggable", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.draggable = toBool(k, n, v); }},
            {"resizable", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.resizable = toBool(k, n, v); }},
            {"resize_handle_size", [](RectStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.resizeHandleSize = toInt(k, n, v, 1); }},
        };
        return options;
    }

    static const std::vector<StyleOption<PointStyle>>& pointOptions()
    {
        static const std::vector<StyleOption<PointStyle>> options = {
            {"point_color", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.pointColor = toColor(k, n, v); }},
            {"point_size", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.pointSize = toInt(k, n, v, 1); }},
            {"label_bg", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelBackground = toColor(k, n, v); }},
            {"label_fg", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelForeground = toColor(k, n, v); }},
            {"label_font", [](PointStyle& s, OverlayKind, const QString&, const QVariant& v) { s.labelFont = OverlayStyle::parseFont(v); }},
            {"alpha", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.alpha = toUnitDouble(k, n, v); }},
            {"draggable", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.draggable = toBool(k, n, v); }},
            {"label_offset_x", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelOffsetX = toInt(k, n, v, INT_MIN); }},
            {"label_offset_y", [](PointStyle& s, OverlayKind k, const QString& n, const QVariant& v) { s.labelOffsetY = toInt(k, n, v, INT_MIN); }},
        };
        return options;
    }

    template<typename Style>
    static Style resolve(OverlayKind                            kind,
                         const std::vector<StyleOption<Style>>& options,
                         const QVariantMap&                     style,
                         StylePolicy                            policy)
    {
        Style out = {};

        for (auto it = style.cbegin(); it != style.cend(); ++it)
        {
            const QString& key = it.key();

            bool handled = false;
            for (const StyleOption<Style>& opt : options)
            {
                if (key == QLatin1String(opt.key))
                {
                    opt.apply(out, kind, key, it.value());
                    handled = true;
                    break;
                }
            }

            if (handled)
                continue;

            if (policy == StylePolicy::Strict)
                fail(kind, key, "is not a recognized option");

            qWarning().noquote() << "[OverlayStyle][Warning] unrecognized" << kindName(kind).data() << "option" << key << "passed through";
            out.extra.insert(key, it.value());
        }

        return out;
    }
} // namespace

namespace OverlayStyle
{

    RectStyle resolveRect(const QVariantMap& style, StylePolicy policy)
    {
        return resolve(OverlayKind::Rect, rectOptions(), style, policy);
    }

    PointStyle resolvePoint(const QVariantMap& style, StylePolicy policy)
    {
        return resolve(OverlayKind::Point, pointOptions(), style, policy);
    }

    void validate(OverlayKind kind, const QVariantMap& style, StylePolicy policy)
    {
        if (kind == OverlayKind::Rect)
            (void)resolveRect(style, policy);
        else
            (void)resolvePoint(style, policy);
    }

    bool isRecognized(OverlayKind kind, const QString& key)
    {
        if (kind == OverlayKind::Rect)
        {
            for (const auto& opt : rectOptions())
                if (key == QLatin1String(opt.key))
                    return true;
            return false;
        }

        for (const auto& opt : pointOptions())
            if (key == QLatin1String(opt.key))
                return true;
        return false;
    }

    FontSpec parseFont(const QVariant& value)
    {
        QStringList parts;
        if (value.typeId() == QMetaType::QVariantList || value.typeId() == QMetaType::QStringList)
        {
            for (const QVariant& v : value.toList())
                parts << v.toString().trimmed();
        }
        else if (value.typeId() == QMetaType::QString)
        {
            for (const QString& p : value.toString().split(QLatin1Char(',')))
                parts << p.trimmed();
        }
        else
        {
            throw InvalidStyleError("OverlayStyle: label_font must be a list or a \"family,size,weight\" string");
        }

        FontSpec font = {};
        if (parts.isEmpty() || parts.front().isEmpty())
            throw InvalidStyleError("OverlayStyle: label_font needs a font family");

        font.family = parts.at(0);

        if (parts.size() > 1)
        {
            bool ok   = false;
            int  size = parts.at(1).toInt(&ok);
            if (!ok || size <= 0)
                throw InvalidStyleError("OverlayStyle: label_font size must be a positive integer");
            font.pointSize = size;
        }

        if (parts.size() > 2)
        {
            const QString weight = parts.at(2).toLower();
            if (weight == QLatin1String("bold"))
                font.bold = true;
            else if (weight == QLatin1String("normal"))
                font.bold = false;
            else
                throw InvalidStyleError("OverlayStyle: label_font weight must be \"bold\" or \"normal\"");
        }
        else if (parts.size() == 2)
        {
            font.bold = false;
        }

        return font;
    }

} // namespace OverlayStyle
