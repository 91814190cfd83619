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

#include "muxconfig.h"

namespace
{
const char muxInfo[] = R"(
; ODR-DabMux configuration
general {
    dabmode 1
    nbframes 0
}

ensemble {
    id 0x1234
    ecc 0xe1
    label "Example Ensemble"
    shortlabel "Example"
}

services {
    srv-one {
        id 0xc479
        label "Radio One"
    }
    srv-two {
        id 0xc221
        ecc 0xe0
        label "Radio Two"
    }
    srv-three {
        id 0xc333
        label "Radio Three"
    }
}

subchannels {
    sub-one {
        type dabplus
        bitrate 96
        id 1
    }
}

components {
    comp-one {
        service srv-one
        subchannel sub-one
    }
    comp-one-data {
        service srv-one
        subchannel sub-one
        scids 2
    }
    comp-two {
        service srv-two
        subchannel sub-one
    }
}
)";
}

TEST_CASE("Multiplex configuration is parsed", "[muxconfig]")
{
    MuxConfig config;
    REQUIRE(config.loadFromData(QByteArray(muxInfo)));

    REQUIRE(config.ecc() == 0xE1);
    REQUIRE(config.eid() == 0x1234);
    REQUIRE(config.label() == QString("Example Ensemble"));
    REQUIRE(config.shortLabel() == QString("Example"));

    SPIEnsembleContext ensemble = config.ensembleContext();
    REQUIRE(ensemble.ecc == 0xE1);
    REQUIRE(ensemble.eid == 0x1234);
    REQUIRE(ensemble.longName == QString("Example Ensemble"));
    REQUIRE(ensemble.shortName == QString("Example"));

    const QList<DabBearer> & bearers = config.bearers();
    REQUIRE(bearers.size() == 4);
    REQUIRE(bearers.at(0) == DabBearer(0xE1, 0x1234, 0xC479, 0));
    REQUIRE(bearers.at(1) == DabBearer(0xE1, 0x1234, 0xC479, 2));
    // service ECC overrides ensemble ECC
    REQUIRE(bearers.at(2) == DabBearer(0xE0, 0x1234, 0xC221, 0));
    // service without component
    REQUIRE(bearers.at(3) == DabBearer(0xE1, 0x1234, 0xC333, 0));
}

TEST_CASE("Invalid multiplex configuration", "[muxconfig]")
{
    MuxConfig config;

    SECTION("missing ensemble")
    {
        REQUIRE_FALSE(config.loadFromData(QByteArray("services {\n srv { id 0xc479 }\n}\n")));
    }
    SECTION("missing ensemble ECC")
    {
        REQUIRE_FALSE(config.loadFromData(QByteArray("ensemble {\n id 0x1234\n}\n")));
    }
    SECTION("invalid number")
    {
        REQUIRE_FALSE(config.loadFromData(QByteArray("ensemble {\n id 0x12zz\n ecc 0xe1\n}\n")));
    }
    SECTION("syntax error")
    {
        REQUIRE_FALSE(config.loadFromData(QByteArray("ensemble {\n id 0x1234\n")));
    }
    SECTION("missing file")
    {
        REQUIRE_FALSE(config.load("/nonexistent/mux.conf"));
    }
}

TEST_CASE("Ensemble without services", "[muxconfig]")
{
    MuxConfig config;
    REQUIRE(config.loadFromData(QByteArray("ensemble {\n id 4660\n ecc 225\n label \"Decimal\"\n}\n")));
    REQUIRE(config.eid() == 0x1234);
    REQUIRE(config.ecc() == 0xE1);
    REQUIRE(config.bearers().isEmpty());
    REQUIRE(config.shortLabel().isEmpty());
}
