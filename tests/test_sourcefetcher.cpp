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

#include "faketransport.h"
#include "sourcefetcher.h"

namespace
{
const char siXml[] = R"(<serviceInformation version="1"><services>
<service><shortName>One</shortName><bearer id="dab:ce1.1234.c479.0"/></service>
<service><shortName>Two</shortName><bearer id="dab:ce1.4321.c221.0"/></service>
</services></serviceInformation>)";

DiscoveryServer server(uint16_t priority, uint16_t weight, const QString & target, uint16_t port = 0)
{
    DiscoveryServer s;
    s.priority = priority;
    s.weight = weight;
    s.target = target;
    s.port = port;
    return s;
}
}

TEST_CASE("Servers are ordered by priority then weight", "[fetcher]")
{
    QList<DiscoveryServer> servers = {
        server(20, 0, "c"), server(10, 5, "b"), server(10, 50, "a"), server(30, 100, "d")
    };
    QList<DiscoveryServer> ordered = SourceFetcher::orderedServers(servers);
    REQUIRE(ordered.size() == 4);
    REQUIRE(ordered.at(0).target == QString("a"));
    REQUIRE(ordered.at(1).target == QString("b"));
    REQUIRE(ordered.at(2).target == QString("c"));
    REQUIRE(ordered.at(3).target == QString("d"));
}

TEST_CASE("Document URLs", "[fetcher]")
{
    DiscoveryResponse response;
    response.fqdn = "radio.example.com";

    SECTION("radiospi uses https, default port omitted")
    {
        response.protocol = DiscoveryResponse::Protocol::RadioSPI;
        REQUIRE(SourceFetcher::serviceInformationUrl(response, server(0, 0, "spi.example.com", 443)).toString()
                == QString("https://spi.example.com/radiodns/spi/3.1/SI.xml"));
    }
    SECTION("radioepg uses http with explicit port")
    {
        response.protocol = DiscoveryResponse::Protocol::RadioEPG;
        REQUIRE(SourceFetcher::serviceInformationUrl(response, server(0, 0, "epg.example.com", 8080)).toString()
                == QString("http://epg.example.com:8080/radiodns/spi/3.1/SI.xml"));
    }
    SECTION("programme information per bearer and day")
    {
        response.protocol = DiscoveryResponse::Protocol::RadioSPI;
        QUrl url = SourceFetcher::programmeInformationUrl(response, server(0, 0, "spi.example.com", 443),
                                                          DabBearer(0xE1, 0x1234, 0xC479, 0), QDate(2024, 1, 2));
        REQUIRE(url.toString() == QString("https://spi.example.com/radiodns/spi/3.1/dab/ce1/1234/c479/0/20240102_PI.xml"));
    }
}

TEST_CASE("Fetch status taxonomy", "[fetcher]")
{
    FakeTransport transport;
    transport.addReply("http://a.example.com/ok", QByteArray("data"));
    transport.addHttpError("http://a.example.com/auth", 401);
    transport.addHttpError("http://a.example.com/server", 500);
    transport.addHttpError("http://a.example.com/unavailable", 503);
    transport.addTransportError("http://b.example.com/any");

    AccessCredentials credentials;
    SourceFetcher fetcher(&transport, credentials);

    QByteArray data;
    REQUIRE(fetcher.fetch(QUrl("http://a.example.com/ok"), data) == FetchStatus::Found);
    REQUIRE(data == QByteArray("data"));
    REQUIRE(fetcher.fetch(QUrl("http://a.example.com/missing"), data) == FetchStatus::NotFound);
    REQUIRE(fetcher.fetch(QUrl("http://a.example.com/auth"), data) == FetchStatus::AuthorizationFailure);
    REQUIRE(fetcher.fetch(QUrl("http://a.example.com/server"), data) == FetchStatus::AuthorizationFailure);
    REQUIRE(fetcher.fetch(QUrl("http://a.example.com/unavailable"), data) == FetchStatus::TransportFailure);
    REQUIRE(fetcher.fetch(QUrl("http://b.example.com/any"), data) == FetchStatus::TransportFailure);
}

TEST_CASE("SI services are filtered by bearer", "[fetcher]")
{
    FakeTransport transport;
    transport.addReply("https://spi.example.com/SI.xml", QByteArray(siXml));
    transport.addReply("https://spi.example.com/broken.xml", QByteArray("<serviceInformation>"));

    AccessCredentials credentials;
    SourceFetcher fetcher(&transport, credentials);
    QList<SPIService> services;

    SECTION("matching bearer")
    {
        QList<DabBearer> bearers = { DabBearer(0xE1, 0x1234, 0xC479, 0) };
        REQUIRE(fetcher.fetchServiceInformation(QUrl("https://spi.example.com/SI.xml"), bearers, services) == FetchStatus::Found);
        REQUIRE(services.size() == 1);
        REQUIRE(services.at(0).shortNames.at(0).text == QString("One"));
    }
    SECTION("no matching bearer gives zero services without failure")
    {
        QList<DabBearer> bearers = { DabBearer(0xE1, 0x1234, 0xC000, 0) };
        REQUIRE(fetcher.fetchServiceInformation(QUrl("https://spi.example.com/SI.xml"), bearers, services) == FetchStatus::Found);
        REQUIRE(services.isEmpty());
    }
    SECTION("malformed document")
    {
        QList<DabBearer> bearers = { DabBearer(0xE1, 0x1234, 0xC479, 0) };
        REQUIRE(fetcher.fetchServiceInformation(QUrl("https://spi.example.com/broken.xml"), bearers, services) == FetchStatus::MalformedDocument);
    }
    SECTION("missing document")
    {
        QList<DabBearer> bearers = { DabBearer(0xE1, 0x1234, 0xC479, 0) };
        REQUIRE(fetcher.fetchServiceInformation(QUrl("https://spi.example.com/none.xml"), bearers, services) == FetchStatus::NotFound);
    }
}

TEST_CASE("Malformed PI is reported", "[fetcher]")
{
    FakeTransport transport;
    transport.addReply("https://spi.example.com/PI.xml", QByteArray("<epg/>"));

    AccessCredentials credentials;
    SourceFetcher fetcher(&transport, credentials);
    SPIProgrammeInformation pi;
    REQUIRE(fetcher.fetchProgrammeInformation(QUrl("https://spi.example.com/PI.xml"), pi) == FetchStatus::MalformedDocument);
}

TEST_CASE("Credential is sent only to its own domain", "[fetcher]")
{
    FakeTransport transport;
    AccessCredentials credentials;
    credentials.insert("x.example.com", "Bearer secret");
    SourceFetcher fetcher(&transport, credentials);

    QByteArray data;
    fetcher.fetch(QUrl("https://x.example.com/radiodns/spi/3.1/SI.xml"), data);
    fetcher.fetch(QUrl("https://X.Example.com/logo.png"), data);
    fetcher.fetch(QUrl("https://y.example.com/radiodns/spi/3.1/SI.xml"), data);
    fetcher.fetch(QUrl("https://x.example.com.other.org/SI.xml"), data);
    fetcher.fetch(QUrl("https://example.com/SI.xml"), data);

    REQUIRE(transport.requests().size() == 5);
    REQUIRE(transport.requests().at(0).second == QByteArray("Bearer secret"));
    REQUIRE(transport.requests().at(1).second == QByteArray("Bearer secret"));
    REQUIRE(transport.requests().at(2).second.isEmpty());
    REQUIRE(transport.requests().at(3).second.isEmpty());
    REQUIRE(transport.requests().at(4).second.isEmpty());
}
