/*
 * This file is part of the SPICarousel project
 *
 * MIT License
 *
 * Copyright (c) 2026 SPICarousel contributors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <QLoggingCategory>
#include <QTime>
#include <iostream>

#include "carousellog.h"

QString formatLogMessage(QtMsgType type, const char *category, const QString &msg)
{
    QString timeStamp = QTime::currentTime().toString("HH:mm:ss.zzz");
    QString txt;
    switch (type)
    {
        case QtDebugMsg:
            txt = QString("%1 [D] %2: %3").arg(timeStamp, category, msg);
            break;
        case QtInfoMsg:
            txt = QString("%1 [I] %2: %3").arg(timeStamp, category, msg);
            break;
        case QtWarningMsg:
            txt = QString("%1 [W] %2: %3").arg(timeStamp, category, msg);
            break;
        case QtCriticalMsg:
            txt = QString("%1 [C] %2: %3").arg(timeStamp, category, msg);
            break;
        case QtFatalMsg:
            txt = QString("%1 [F] %2: %3").arg(timeStamp, category, msg);
            break;
    }
    return txt;
}

// this is default log handler printing to stderr
static void logHandlerDefault(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    std::cerr << formatLogMessage(type, context.category, msg).toStdString() << std::endl;
}

// this is custom log handler printing QT_MESSAGE_PATTERN format to stderr
static void logHandlerCustom(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    std::cerr << qFormatLogMessage(type, context, msg).toStdString() << std::endl;
}

void setupLogging(bool verbose)
{
    if (qEnvironmentVariable("QT_MESSAGE_PATTERN", "").isEmpty())
    {
        qInstallMessageHandler(logHandlerDefault);
    }
    else
    {
        qInstallMessageHandler(logHandlerCustom);
    }

    if (verbose)
    {
        QLoggingCategory::setFilterRules("*.debug=true");
    }
    else
    {
        QLoggingCategory::setFilterRules("*.debug=false\nqt.*.info=false");
    }
}
