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

#include <QBuffer>
#include <QImage>
#include <QImageWriter>
#include <QLoggingCategory>
#include <QSet>

#include "imagenormalizer.h"

Q_LOGGING_CATEGORY(imageNormalizer, "ImageNormalizer", QtInfoMsg)

namespace
{
const QList<QSize> logoSizeWhitelist = {
    QSize(32, 32), QSize(112, 32), QSize(128, 128), QSize(320, 240), QSize(600, 600)
};
const QByteArray pngSignature("\x89PNG\r\n\x1a\n", 8);
const int logoNameLength = 8;
}

ImageNormalizer::ImageNormalizer(const SourceFetcher &fetcher, int sizeThreshold)
    : m_fetcher(fetcher)
    , m_sizeThreshold(sizeThreshold)
{}

SPIService ImageNormalizer::normalize(const SPIService &service, QList<AssembledObject> &objects)
{
    QString owner = serviceKey(service);
    SPIService normalized = service;
    normalized.mediaItems.clear();

    QSet<QString> seen;
    int counter = 0;
    for (const SPIMultimedia & multimedia : service.mediaItems)
    {
        if (!isAccepted(multimedia))
        {
            qCDebug(imageNormalizer) << "Media not accepted:" << multimedia.url << multimedia.mimeValue
                                     << multimedia.width << "x" << multimedia.height;
            continue;
        }

        QSize size = canonicalSize(multimedia);
        QString key = QString("%1|%2x%3").arg(multimedia.url).arg(size.width()).arg(size.height());
        if (seen.contains(key))
        {
            qCDebug(imageNormalizer) << "Duplicate media:" << multimedia.url;
            continue;
        }
        seen.insert(key);

        // sequence number is given before download so that naming does not depend on fetch results
        QString name = logoName(service, ++counter, size);
        if (m_nameOwner.contains(name) && (owner != m_nameOwner.value(name)))
        {   // name stem shared with another service
            name = logoName(service, counter, size, true);
            qCDebug(imageNormalizer) << "Logo name of" << owner << "qualified to" << name;
        }
        else { /* name is free or already used by this service */ }
        m_nameOwner.insert(name, owner);

        QByteArray data;
        FetchStatus status = m_fetcher.fetch(QUrl(multimedia.url), data);
        if (FetchStatus::Found != status)
        {
            qCWarning(imageNormalizer) << "Logo" << multimedia.url << "not available:" << fetchStatusToString(status);
            continue;
        }

        QByteArray png;
        if (!normalizeImage(data, size, m_sizeThreshold, png))
        {
            qCWarning(imageNormalizer) << "Logo" << multimedia.url << "could not be decoded";
            continue;
        }

        SPIMultimedia logo = multimedia;
        logo.type = classify(size);
        logo.mimeValue = "image/png";
        logo.url = name;
        logo.width = size.width();
        logo.height = size.height();
        normalized.mediaItems.append(logo);

        AssembledObject object;
        object.name = name;
        object.data = png;
        object.contentType = int(DabMotContentType::Image);
        object.contentSubType = int(DabMotContentSubType::ImagePNG);
        objects.append(object);

        qCInfo(imageNormalizer) << multimedia.url << "===>" << name << png.size() << "bytes";
    }

    return normalized;
}

bool ImageNormalizer::isAccepted(const SPIMultimedia &multimedia)
{
    if ((SPIMultimedia::Type::SquareLogo == multimedia.type) || (SPIMultimedia::Type::RectangleLogo == multimedia.type))
    {
        return true;
    }
    return ("image/png" == multimedia.mimeValue) && logoSizeWhitelist.contains(QSize(multimedia.width, multimedia.height));
}

QSize ImageNormalizer::canonicalSize(const SPIMultimedia &multimedia)
{
    switch (multimedia.type)
    {
    case SPIMultimedia::Type::SquareLogo:
        return QSize(32, 32);
    case SPIMultimedia::Type::RectangleLogo:
        return QSize(112, 32);
    default:
        return QSize(multimedia.width, multimedia.height);
    }
}

SPIMultimedia::Type ImageNormalizer::classify(const QSize &size)
{
    if (QSize(32, 32) == size)
    {
        return SPIMultimedia::Type::SquareLogo;
    }
    if (QSize(112, 32) == size)
    {
        return SPIMultimedia::Type::RectangleLogo;
    }
    return SPIMultimedia::Type::Unrestricted;
}

QString ImageNormalizer::logoName(const SPIService &service, int counter, const QSize &size, bool withServiceId)
{
    QString name = service.displayShortName().left(logoNameLength);
    name.replace(' ', '_');
    name.replace('/', '_');
    if (withServiceId && !service.bearers.isEmpty())
    {
        name = QString("%1_%2").arg(name, service.bearers.at(0).sidString());
    }
    else { /* short name only */ }
    return QString("%1_%2_%3x%4.png").arg(name).arg(counter).arg(size.width()).arg(size.height());
}

QString ImageNormalizer::serviceKey(const SPIService &service)
{
    if (service.bearers.isEmpty())
    {
        return service.displayShortName();
    }
    return service.bearers.at(0).toUri();
}

bool ImageNormalizer::normalizeImage(const QByteArray &data, const QSize &size, int sizeThreshold, QByteArray &png)
{
    QImage image;
    if (!image.loadFromData(data))
    {
        return false;
    }

    bool reencode = !data.startsWith(pngSignature);
    if (image.size() != size)
    {
        qCDebug(imageNormalizer) << "Scaling" << image.size() << "to" << size;
        image = image.scaled(size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
        reencode = true;
    }

    if (reencode)
    {
        QBuffer buffer(&png);
        buffer.open(QIODevice::WriteOnly);
        QImageWriter writer(&buffer, "png");
        if (!writer.write(image))
        {
            qCWarning(imageNormalizer) << "PNG encoding failed:" << writer.errorString();
            return false;
        }
    }
    else
    {
        png = data;
    }

    if (png.size() > sizeThreshold)
    {   // lossy fallback to bound object size
        QByteArray recompressed = recompress(image);
        qCDebug(imageNormalizer) << "Recompressed" << png.size() << "->" << recompressed.size() << "bytes";
        if (!recompressed.isEmpty() && (recompressed.size() < png.size()))
        {
            png = recompressed;
        }
    }

    return true;
}

QByteArray ImageNormalizer::recompress(const QImage &image)
{
    QImage indexed = image.convertToFormat(QImage::Format_Indexed8);

    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QImageWriter writer(&buffer, "png");
    writer.setQuality(0);   // highest zlib compression
    if (!writer.write(indexed))
    {
        qCWarning(imageNormalizer) << "Palette PNG encoding failed:" << writer.errorString();
        return QByteArray();
    }
    return out;
}
