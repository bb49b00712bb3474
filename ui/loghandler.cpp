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

#include "loghandler.h"
#include "globalsetting.h"
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QThread>
#include <iostream>

namespace {
QMutex s_mutex;
QString s_logFilePath;
}

LogHandler::LogHandler(QObject *parent)
    : QObject(parent)
{
}

LogHandler& LogHandler::instance()
{
    static LogHandler instance;
    return instance;
}

void LogHandler::enableLogStore()
{
    const bool storeLog = GlobalSetting::instance().getLogStore();
    const QString path = GlobalSetting::instance().getLogFilePath();
    if (storeLog && !path.isEmpty())
    {
        setLogFilePath(path);
        qInstallMessageHandler(fileMessageHandler);
    }
    else
    {
        if (storeLog) {
            qWarning() << "Log storing is enabled but no log file path is set";
        }
        qInstallMessageHandler(customMessageHandler);
    }
    qDebug() << "Store log is" << storeLog;
}

void LogHandler::setLogFilePath(const QString &path)
{
    QMutexLocker locker(&s_mutex);
    s_logFilePath = path;
}

QString LogHandler::logFilePath()
{
    QMutexLocker locker(&s_mutex);
    return s_logFilePath;
}

QString LogHandler::formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const char* categoryName = context.category;
    QString category = categoryName ? QString(categoryName) : "lbx.default.msg";
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QThread *currentThread = QThread::currentThread();
    QString threadName = currentThread->objectName().isEmpty() ? QString::number(reinterpret_cast<quintptr>(currentThread->currentThreadId())) : currentThread->objectName();
    QString txt = QString("[%1][%2] ").arg(timestamp).arg(threadName);

    switch (type) {
        case QtDebugMsg:
            txt += QString("[D][%1]: %2").arg(category, msg);
            break;
        case QtWarningMsg:
            txt += QString("[W][%1]: %2").arg(category, msg);
            break;
        case QtCriticalMsg:
            txt += QString("[C][%1]: %2").arg(category, msg);
            break;
        case QtFatalMsg:
            txt += QString("[F][%1]: %2").arg(category, msg);
            break;
        case QtInfoMsg:
            txt += QString("[I][%1]: %2").arg(category, msg);
            break;
    }
    return txt;
}

void LogHandler::fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const QString txt = formatMessage(type, context, msg);

    QMutexLocker locker(&s_mutex);
    QFile outFile(s_logFilePath);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Append))
    {
        // Still visible on the console
        std::cerr << txt.toStdString() << std::endl;
        return;
    }

    QTextStream ts(&outFile);
    ts << txt;
    if (context.file) {
        ts << " (" << context.file << ":" << context.line << ")";
    }
    ts << "\n";
    ts.flush();
}


void LogHandler::customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    std::cout << formatMessage(type, context, msg).toStdString() << std::endl;
}
