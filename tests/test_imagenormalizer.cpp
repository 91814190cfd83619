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

#include <catch2/catch.hpp>

#include <QImage>

#include "faketransport.h"
#include "imagenormalizer.h"

namespace
{
SPIMultimedia media(SPIMultimedia::Type type, const QString & mime, int width, int height, const QString & url)
{
    SPIMultimedia multimedia;
    multimedia.type = type;
    multimedia.mimeValue = mime;
    multimedia.width = width;
    multimedia.height = height;
    multimedia.url = url;
    return multimedia;
}

const QByteArray pngSignature("\x89PNG\r\n\x1a\n", 8);
}

TEST_CASE("Logo acceptance policy", "[image]")
{
    using Type = SPIMultimedia::Type;
    REQUIRE(ImageNormalizer::isAccepted(media(Type::SquareLogo, "image/jpeg", 0, 0, "a")));
    REQUIRE(ImageNormalizer::isAccepted(media(Type::RectangleLogo, QString(), 10, 10, "a")));
    REQUIRE(ImageNormalizer::isAccepted(media(Type::Unknown, "image/png", 128, 128, "a")));
    REQUIRE(ImageNormalizer::isAccepted(media(Type::Unrestricted, "image/png", 320, 240, "a")));
    REQUIRE(ImageNormalizer::isAccepted(media(Type::Unrestricted, "image/png", 600, 600, "a")));
    REQUIRE_FALSE(ImageNormalizer::isAccepted(media(Type::Unrestricted, "image/jpeg", 320, 240, "a")));
    REQUIRE_FALSE(ImageNormalizer::isAccepted(media(Type::Unrestricted, "image/png", 800, 600, "a")));
}

TEST_CASE("Logo dimensions and classification", "[image]")
{
    using Type = SPIMultimedia::Type;

    SECTION("square and rectangle logos are forced to canonical size")
    {
        REQUIRE(ImageNormalizer::canonicalSize(media(Type::SquareLogo, "image/png", 600, 600, "a")) == QSize(32, 32));
        REQUIRE(ImageNormalizer::canonicalSize(media(Type::RectangleLogo, "image/png", 320, 240, "a")) == QSize(112, 32));
    }
    SECTION("other logos keep reported size")
    {
        REQUIRE(ImageNormalizer::canonicalSize(media(Type::Unrestricted, "image/png", 320, 240, "a")) == QSize(320, 240));
    }
    SECTION("classification from final size")
    {
        REQUIRE(ImageNormalizer::classify(QSize(32, 32)) == Type::SquareLogo);
        REQUIRE(ImageNormalizer::classify(QSize(112, 32)) == Type::RectangleLogo);
        for (const QSize & size : {QSize(128, 128), QSize(320, 240), QSize(600, 600)})
        {
            REQUIRE(ImageNormalizer::classify(size) == Type::Unrestricted);
        }
    }
}

TEST_CASE("Logo names", "[image]")
{
    SPIService service;
    service.shortNames.append(SPIText{"Radio One FM", QString()});
    REQUIRE(ImageNormalizer::logoName(service, 1, QSize(32, 32)) == QString("Radio_On_1_32x32.png"));

    SPIService unnamed;
    unnamed.bearers.append(DabBearer(0xE1, 0x1234, 0xC479, 0));
    REQUIRE(ImageNormalizer::logoName(unnamed, 2, QSize(320, 240)) == QString("c479_2_320x240.png"));

    SPIService longSId;
    longSId.longNames.append(SPIText{"BBC Radio 1", QString()});
    longSId.bearers.append(DabBearer(0xE1, 0x1234, 0xE1C47900, 0));
    REQUIRE(ImageNormalizer::logoName(longSId, 1, QSize(32, 32), true) == QString("BBC_Radi_e1c47900_1_32x32.png"));
}

TEST_CASE("Service logos are normalized", "[image]")
{
    using Type = SPIMultimedia::Type;

    FakeTransport transport;
    transport.addReply("http://logo.example.com/square.png", solidPng(64, 64));
    transport.addReply("http://logo.example.com/sls.png", solidPng(320, 240));
    transport.addReply("http://logo.example.com/wide.bmp", imageData(QImage(112, 32, QImage::Format_RGB32), "bmp"));

    SPIService service;
    service.shortNames.append(SPIText{"Radio", QString()});
    service.mediaItems = {
        media(Type::SquareLogo, "image/png", 600, 600, "http://logo.example.com/square.png"),
        media(Type::Unrestricted, "image/jpeg", 320, 240, "http://logo.example.com/photo.jpg"),
        media(Type::SquareLogo, "image/png", 32, 32, "http://logo.example.com/square.png"),
        media(Type::Unknown, "image/png", 320, 240, "http://logo.example.com/missing.png"),
        media(Type::Unrestricted, "image/png", 320, 240, "http://logo.example.com/sls.png"),
        media(Type::RectangleLogo, "image/bmp", 0, 0, "http://logo.example.com/wide.bmp"),
    };

    AccessCredentials credentials;
    SourceFetcher fetcher(&transport, credentials);
    ImageNormalizer normalizer(fetcher, 5120);

    QList<AssembledObject> objects;
    SPIService result = normalizer.normalize(service, objects);

    // rejected jpeg and duplicate are not fetched, missing logo keeps its sequence number
    REQUIRE_FALSE(transport.wasRequested("http://logo.example.com/photo.jpg"));
    REQUIRE(objects.size() == 3);
    REQUIRE(result.mediaItems.size() == 3);

    REQUIRE(objects.at(0).name == QString("Radio_1_32x32.png"));
    REQUIRE(objects.at(1).name == QString("Radio_3_320x240.png"));
    REQUIRE(objects.at(2).name == QString("Radio_4_112x32.png"));

    REQUIRE(result.mediaItems.at(0).type == Type::SquareLogo);
    REQUIRE(result.mediaItems.at(0).url == objects.at(0).name);
    REQUIRE(result.mediaItems.at(0).width == 32);
    REQUIRE(result.mediaItems.at(1).type == Type::Unrestricted);
    REQUIRE(result.mediaItems.at(2).type == Type::RectangleLogo);
    for (const SPIMultimedia & item : result.mediaItems)
    {
        REQUIRE(item.mimeValue == QString("image/png"));
    }

    for (const AssembledObject & object : objects)
    {
        REQUIRE(object.contentType == 2);
        REQUIRE(object.contentSubType == 3);
        REQUIRE(object.data.startsWith(pngSignature));
    }

    QImage square;
    REQUIRE(square.loadFromData(objects.at(0).data));
    REQUIRE(square.size() == QSize(32, 32));

    // input service is left as it was
    REQUIRE(service.mediaItems.size() == 6);
}

TEST_CASE("Oversized logos are recompressed", "[image]")
{
    QByteArray original = imageData(noiseImage(320, 240), "png");
    REQUIRE(original.size() > 5120);

    QByteArray png;
    REQUIRE(ImageNormalizer::normalizeImage(original, QSize(320, 240), 5120, png));
    REQUIRE(png.size() <= original.size());

    QImage image;
    REQUIRE(image.loadFromData(png));
    REQUIRE(image.size() == QSize(320, 240));
}

TEST_CASE("Small logos are passed unchanged", "[image]")
{
    QByteArray original = solidPng(32, 32);
    REQUIRE(original.size() <= 5120);

    QByteArray png;
    REQUIRE(ImageNormalizer::normalizeImage(original, QSize(32, 32), 5120, png));
    REQUIRE(png == original);
}

TEST_CASE("Undecodable logo is rejected", "[image]")
{
    QByteArray png;
    REQUIRE_FALSE(ImageNormalizer::normalizeImage(QByteArray("not an image"), QSize(32, 32), 5120, png));
}
