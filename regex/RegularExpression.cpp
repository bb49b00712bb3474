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

#include "RegularExpression.h"

RegularExpression::RegularExpression() {
    geometryRegex = QRegularExpression(QString(R"(^((\d+%?)?(x)?(\d+%?)?)?(([+-])(\d+%?)([+-])(\d+%?))?$)"));
    yesRegex = QRegularExpression(QString("^(Y|1|True)$"), QRegularExpression::CaseInsensitiveOption);
    noRegex = QRegularExpression(QString("^(N|0|False)$"), QRegularExpression::CaseInsensitiveOption);
    numberRegex = QRegularExpression(QString(R"(^-?\d+(\.\d+)?$)"));
}
