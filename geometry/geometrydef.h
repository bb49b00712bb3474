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

#ifndef GEOMETRYDEF_H
#define GEOMETRYDEF_H

#include <QString>
#include <QtGlobal>
#include <optional>

/**
 * @brief Parsed external window geometry directive of the form [W[xH]][+-X+-Y]
 *
 * Each number may carry a '%' suffix, making it a percentage of the screen's
 * visible frame. A '+' sign offsets from the near edge (left or bottom) and a
 * '-' sign offsets from the far edge. Examples: "1280", "x720", "50%+0+0",
 * "640x360-10-10".
 */
class GeometryDef
{
public:
    /**
     * @brief Parse @p directive
     * @return nothing if the string is empty or is not a valid directive
     */
    static std::optional<GeometryDef> parse(const QString &directive);

    std::optional<qreal> width;
    std::optional<qreal> height;
    std::optional<qreal> x;
    std::optional<qreal> y;
    bool widthIsPercentage = false;
    bool heightIsPercentage = false;
    bool xIsPercentage = false;
    bool yIsPercentage = false;
    QChar xSign = QLatin1Char('+');
    QChar ySign = QLatin1Char('+');

    bool hasSize() const { return width.has_value() || height.has_value(); }
    bool hasPosition() const { return x.has_value() && y.has_value(); }

    /**
     * @brief Window origin along one axis, relative to the screen origin
     * @param screenLength width (or height) of the screen's visible frame
     * @param windowLength width (or height) of the window being placed
     *
     * A percentage places the window's center at that fraction of the screen.
     */
    qreal resolveX(qreal screenLength, qreal windowLength) const;
    qreal resolveY(qreal screenLength, qreal windowLength) const;

    QString toString() const;

private:
    static qreal resolve(qreal value, bool isPercentage, QChar sign, qreal screenLength, qreal windowLength);
};

#endif // GEOMETRYDEF_H
