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

#ifndef REGULAR_EXPRESSIONS_H
#define REGULAR_EXPRESSIONS_H

#include <QRegularExpression>
#include <QString>

class RegularExpression {
public:
    RegularExpression(const RegularExpression&) = delete;
    RegularExpression& operator=(const RegularExpression&) = delete;
    
    static RegularExpression& instance() {
        static RegularExpression instance;
        return instance;
    }

    // [W[xH]][+-X+-Y], each number optionally a percentage
    QRegularExpression geometryRegex;
    QRegularExpression yesRegex;
    QRegularExpression noRegex;
    QRegularExpression numberRegex;

private:
    RegularExpression();
    ~RegularExpression() = default;
};

#endif // REGULAR_EXPRESSIONS_H
