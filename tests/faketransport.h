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

#ifndef FAKETRANSPORT_H
#define FAKETRANSPORT_H

#include <QBuffer>
#include <QHash>
#include <QImage>
#include <QList>
#include <QPair>

#include "networktransport.h"

// in-memory transport, unknown URLs answer 404
class FakeTransport : public NetworkTransport
{
public:
    void addReply(const QString & url, const QByteArray & data)
    {
        NetworkReply reply;
        reply.httpStatus = 200;
        reply.data = data;
        m_replies.insert(url, reply);
    }

    void addHttpError(const QString & url, int httpStatus)
    {
        NetworkReply reply;
        reply.error = NetworkReply::Error::HttpError;
        reply.httpStatus = httpStatus;
        reply.errorString = QString("HTTP %1").arg(httpStatus);
        m_replies.insert(url, reply);
    }

    void addTransportError(const QString & url)
    {
        NetworkReply reply;
        reply.error = NetworkReply::Error::TransportError;
        reply.errorString = "Connection refused";
        m_replies.insert(url, reply);
    }

    NetworkReply get(const QUrl & url, const QByteArray & authorization) override
    {
        m_requests.append(qMakePair(url.toString(), authorization));
        if (m_replies.contains(url.toString()))
        {
            return m_replies.value(url.toString());
        }
        NetworkReply reply;
        reply.error = NetworkReply::Error::HttpError;
        reply.httpStatus = 404;
        return reply;
    }

    const QList<QPair<QString, QByteArray>> & requests() const { return m_requests; }

    QByteArray authorizationFor(const QString & url) const
    {
        for (const auto & request : m_requests)
        {
            if (request.first == url)
            {
                return request.second;
            }
        }
        return QByteArray();
    }

    bool wasRequested(const QString & url) const
    {
        for (const auto & request : m_requests)
        {
            if (request.first == url)
            {
                return true;
            }
        }
        return false;
    }

private:
    QHash<QString, NetworkReply> m_replies;
    QList<QPair<QString, QByteArray>> m_requests;
};

inline QByteArray imageData(const QImage & image, const char * format)
{
    QByteArray data;
    QBuffer buffer(&data);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, format);
    return data;
}

inline QByteArray solidPng(int width, int height)
{
    QImage image(width, height, QImage::Format_RGB32);
    image.fill(QColor(200, 30, 30));
    return imageData(image, "png");
}

// pseudo random content that does not compress well
inline QImage noiseImage(int width, int height)
{
    QImage image(width, height, QImage::Format_RGB32);
    uint32_t state = 12345;
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            state = state * 1103515245 + 12345;
            image.setPixel(x, y, qRgb((state >> 16) & 0xFF, (state >> 8) & 0xFF, (state >> 24) & 0xFF));
        }
    }
    return image;
}

#endif // FAKETRANSPORT_H
