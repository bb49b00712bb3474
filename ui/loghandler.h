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

#ifndef LOGHANDLER_H
#define LOGHANDLER_H

#include <QObject>
#include <QString>
#include <QLoggingCategory>

class LogHandler : public QObject
{
    Q_OBJECT

public:
    explicit LogHandler(QObject *parent = nullptr);

    static LogHandler& instance();

    /**
     * @brief Install the file handler if log storing is enabled, else the console handler
     */
    void enableLogStore();

    /// Path the file handler appends to
    static void setLogFilePath(const QString &path);
    static QString logFilePath();

    /// One formatted log line, without the trailing newline
    static QString formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg);

    static void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    static void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
};


#endif // LOGHANDLER_H
