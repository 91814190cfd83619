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

#include <QTemporaryFile>

#include "accesscredentials.h"

TEST_CASE("Credentials CSV is parsed", "[credentials]")
{
    AccessCredentials credentials;
    credentials.loadFromData(QByteArray(
        "# fqdn,credential\n"
        "x.example.com,Bearer abc\n"
        "\n"
        "  Y.Example.COM , Basic dXNlcjpwYXNz \r\n"
        "invalid line\n"
        ",missing-fqdn\n"
        "missing-credential.example.com,\n"
        "z.example.com,token,with,commas\n"));

    REQUIRE(credentials.count() == 3);
    REQUIRE(credentials.credentialFor(QUrl("https://x.example.com/SI.xml")) == QByteArray("Bearer abc"));
    REQUIRE(credentials.credentialFor(QUrl("https://y.example.com/SI.xml")) == QByteArray("Basic dXNlcjpwYXNz"));
    REQUIRE(credentials.credentialFor(QUrl("http://z.example.com:8080/SI.xml")) == QByteArray("token,with,commas"));
}

TEST_CASE("Credential matches exact host only", "[credentials]")
{
    AccessCredentials credentials;
    credentials.insert("x.example.com", "secret");

    REQUIRE(credentials.credentialFor(QUrl("https://x.example.com/a")) == QByteArray("secret"));
    REQUIRE(credentials.credentialFor(QUrl("http://x.example.com:8080/b")) == QByteArray("secret"));
    REQUIRE(credentials.credentialFor(QUrl("https://a.x.example.com/a")).isEmpty());
    REQUIRE(credentials.credentialFor(QUrl("https://example.com/a")).isEmpty());
    REQUIRE(credentials.credentialFor(QUrl("https://x.example.com.evil.org/a")).isEmpty());
}

TEST_CASE("Credentials file", "[credentials]")
{
    QTemporaryFile file;
    REQUIRE(file.open());
    file.write("x.example.com,secret\n");
    file.close();

    AccessCredentials credentials;
    REQUIRE(credentials.loadFromFile(file.fileName()));
    REQUIRE(credentials.count() == 1);

    AccessCredentials missing;
    REQUIRE_FALSE(missing.loadFromFile("/nonexistent/credentials.csv"));
    REQUIRE(missing.isEmpty());
}
