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

#include "rectutil.h"
#include <QtMath>
#include <cmath>

Q_LOGGING_CATEGORY(log_core_geometry, "lbx.core.geometry")

namespace RectUtil {

qreal snap(qreal value, qreal other)
{
    if (std::abs(value - other) < 1) {
        return other;
    }
    return std::round(value);
}

qreal aspect(const QSizeF &size)
{
    if (size.height() == 0) {
        return 0;
    }
    return size.width() / size.height();
}

bool isSameAspect(qreal a, qreal b)
{
    return std::round(a * 1e6) == std::round(b * 1e6);
}

QSizeF shrink(const QSizeF &size, const QSizeF &maxSize)
{
    if (size.width() <= maxSize.width() && size.height() <= maxSize.height()) {
        return size;
    }
    return size.scaled(maxSize, Qt::KeepAspectRatio);
}

QRectF constrain(const QRectF &rect, const QRectF &container)
{
    QSizeF newSize = rect.size();
    if (newSize.width() > container.width() || newSize.height() > container.height()) {
        qCWarning(log_core_geometry) << "Rect" << toString(rect.size())
                                     << "is larger than the rect it is being constrained in"
                                     << toString(container) << "- shrinking it, which may be imprecise";
        newSize = shrink(newSize, container.size());
    }

    qreal x = rect.x();
    qreal y = rect.y();
    if (x < container.x()) {
        x = container.x();
    }
    if (y < container.y()) {
        y = container.y();
    }
    if (x + newSize.width() > maxX(container)) {
        x = maxX(container) - newSize.width();
    }
    if (y + newSize.height() > maxY(container)) {
        y = maxY(container) - newSize.height();
    }
    return QRectF(QPointF(x, y), newSize);
}

QRectF centeredRect(const QSizeF &size, const QRectF &container)
{
    return QRectF(container.x() + (container.width() - size.width()) / 2,
                  container.y() + (container.height() - size.height()) / 2,
                  size.width(),
                  size.height());
}

QRectF flipVertically(const QRectF &rect, qreal referenceHeight)
{
    return QRectF(rect.x(), referenceHeight - rect.y() - rect.height(), rect.width(), rect.height());
}

QString toString(const QRectF &rect)
{
    return QString("(%1, %2, %3x%4)").arg(rect.x()).arg(rect.y()).arg(rect.width()).arg(rect.height());
}

QString toString(const QSizeF &size)
{
    return QString("%1x%2").arg(size.width()).arg(size.height());
}

} // namespace RectUtil
