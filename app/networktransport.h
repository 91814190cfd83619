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

#ifndef NETWORKTRANSPORT_H
#define NETWORKTRANSPORT_H

#include <QByteArray>
#include <QString>
#include <QUrl>

struct NetworkReply
{
    enum class Error
    {
        NoError,
        HttpError,        // server answered with error status
        TransportError,   // connection, TLS, timeout ...
    };

    Error error = Error::NoError;
    int httpStatus = 0;
    QString errorString;
    QByteArray data;
};

// Blocking request/response transport used by the fetchers
class NetworkTransport
{
public:
    virtual ~NetworkTransport() = default;

    // authorization is sent verbatim as Authorization header when not empty
    virtual NetworkReply get(const QUrl & url, const QByteArray & authorization) = 0;
};

#endif // NETWORKTRANSPORT_H
