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

#ifndef RECTUTIL_H
#define RECTUTIL_H

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(log_core_geometry)

/**
 * @brief Rectangle and size helpers shared by the geometry classes
 *
 * All rectangles here use a bottom-left origin with y growing upward: x() and y()
 * are the leading and bottom edges.
 */
namespace RectUtil {

    /**
     * @brief Snap @p value to @p other if they are less than 1 unit apart, else round it
     *
     * Absorbs division imprecision so results end up as whole numbers.
     */
    qreal snap(qreal value, qreal other);

    /**
     * @brief Width divided by height, or 0 for an empty height
     */
    qreal aspect(const QSizeF &size);

    /**
     * @brief True if two aspect ratios are equal to 6 decimal places
     */
    bool isSameAspect(qreal a, qreal b);

    inline qreal maxX(const QRectF &rect) { return rect.x() + rect.width(); }
    inline qreal maxY(const QRectF &rect) { return rect.y() + rect.height(); }

    /**
     * @brief Move @p rect so that it lies fully inside @p container
     *
     * If @p rect is larger than @p container it is first shrunk (keeping its aspect)
     * and a warning is logged, since callers should have sized it already.
     */
    QRectF constrain(const QRectF &rect, const QRectF &container);

    /**
     * @brief Rectangle of @p size centered in @p container
     */
    QRectF centeredRect(const QSizeF &size, const QRectF &container);

    /**
     * @brief Largest size with the aspect of @p size which fits in @p maxSize
     */
    QSizeF shrink(const QSizeF &size, const QSizeF &maxSize);

    /**
     * @brief Convert between top-left (Qt widget) and bottom-left (model) coordinates
     * @param referenceHeight height of the reference area (the primary screen)
     *
     * The conversion is its own inverse.
     */
    QRectF flipVertically(const QRectF &rect, qreal referenceHeight);

    QString toString(const QRectF &rect);
    QString toString(const QSizeF &size);
}

#endif // RECTUTIL_H
