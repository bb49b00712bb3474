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

#ifndef BOXQUAD_H
#define BOXQUAD_H

#include <QtGlobal>
#include <QDebug>

/**
 * @brief Size values of the four sides of a box
 *
 * Used for bar sizes (outside or inside the viewport) and for viewport margins.
 */
struct BoxQuad
{
    qreal top = 0;
    qreal trailing = 0;
    qreal bottom = 0;
    qreal leading = 0;

    BoxQuad() = default;
    BoxQuad(qreal top, qreal trailing, qreal bottom, qreal leading)
        : top(top), trailing(trailing), bottom(bottom), leading(leading) {}

    qreal totalWidth() const { return leading + trailing; }
    qreal totalHeight() const { return top + bottom; }

    static BoxQuad zero() { return BoxQuad(); }

    bool operator==(const BoxQuad &other) const {
        return top == other.top && trailing == other.trailing
            && bottom == other.bottom && leading == other.leading;
    }
    bool operator!=(const BoxQuad &other) const { return !(*this == other); }
};

inline QDebug operator<<(QDebug dbg, const BoxQuad &quad)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "BoxQuad(top:" << quad.top << " trail:" << quad.trailing
                  << " btm:" << quad.bottom << " lead:" << quad.leading << ")";
    return dbg;
}

#endif // BOXQUAD_H
