/*
* ========================================================================== *
*                                                                            *
*    This file is part of the Letterbox player window layout engine          *
*                                                                            *
*    Copyright (C) 2024   <info@openterface.com>                             *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#include "geometrydef.h"
#include "rectutil.h"
#include "regex/RegularExpression.h"
#include <QRegularExpressionMatch>

// Splits "50%" into (50, true) and "50" into (50, false)
static bool parseNumber(const QString &token, qreal &value, bool &isPercentage)
{
    QString digits = token;
    isPercentage = digits.endsWith(QLatin1Char('%'));
    if (isPercentage) {
        digits.chop(1);
    }
    bool ok = false;
    value = digits.toInt(&ok);
    return ok;
}

std::optional<GeometryDef> GeometryDef::parse(const QString &directive)
{
    if (directive.isEmpty()) {
        return std::nullopt;
    }

    const QRegularExpressionMatch match = RegularExpression::instance().geometryRegex.match(directive);
    if (!match.hasMatch()) {
        qCWarning(log_core_geometry) << "Invalid geometry directive:" << directive;
        return std::nullopt;
    }

    GeometryDef def;
    qreal value = 0;
    bool isPercentage = false;

    const QString w = match.captured(2);
    const QString h = match.captured(4);
    if (!w.isEmpty() && parseNumber(w, value, isPercentage) && value > 0) {
        def.width = value;
        def.widthIsPercentage = isPercentage;
    }
    if (!h.isEmpty() && parseNumber(h, value, isPercentage) && value > 0) {
        def.height = value;
        def.heightIsPercentage = isPercentage;
    }

    const QString x = match.captured(7);
    const QString y = match.captured(9);
    if (!x.isEmpty() && !y.isEmpty()) {
        if (parseNumber(x, value, isPercentage)) {
            def.x = value;
            def.xIsPercentage = isPercentage;
            def.xSign = match.captured(6).at(0);
        }
        if (parseNumber(y, value, isPercentage)) {
            def.y = value;
            def.yIsPercentage = isPercentage;
            def.ySign = match.captured(8).at(0);
        }
    }

    if (!def.hasSize() && !def.hasPosition()) {
        qCWarning(log_core_geometry) << "Geometry directive sets neither size nor position:" << directive;
        return std::nullopt;
    }
    qCDebug(log_core_geometry) << "Parsed geometry directive" << directive << "->" << def.toString();
    return def;
}

qreal GeometryDef::resolve(qreal value, bool isPercentage, QChar sign, qreal screenLength, qreal windowLength)
{
    if (isPercentage) {
        const qreal center = value * 0.01 * screenLength;
        if (sign == QLatin1Char('-')) {
            return screenLength - center - windowLength / 2;
        }
        return center - windowLength / 2;
    }
    if (sign == QLatin1Char('-')) {
        return screenLength - value - windowLength;
    }
    return value;
}

qreal GeometryDef::resolveX(qreal screenLength, qreal windowLength) const
{
    return resolve(x.value_or(0), xIsPercentage, xSign, screenLength, windowLength);
}

qreal GeometryDef::resolveY(qreal screenLength, qreal windowLength) const
{
    return resolve(y.value_or(0), yIsPercentage, ySign, screenLength, windowLength);
}

QString GeometryDef::toString() const
{
    auto part = [](const std::optional<qreal> &value, bool isPercentage) -> QString {
        if (!value) {
            return QStringLiteral("nil");
        }
        return QString::number(*value) + (isPercentage ? QStringLiteral("%") : QString());
    };
    return QString("GeometryDef(W: %1, H: %2, X: %3%4, Y: %5%6)")
        .arg(part(width, widthIsPercentage), part(height, heightIsPercentage),
             QString(xSign), part(x, xIsPercentage),
             QString(ySign), part(y, yIsPercentage));
}
