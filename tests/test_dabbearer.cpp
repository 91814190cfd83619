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

#include "dabbearer.h"
#include "dabtables.h"

TEST_CASE("Bearer URI is parsed and rebuilt", "[bearer]")
{
    DabBearer bearer = DabBearer::fromUri("dab:ce1.c181.c479.0");
    REQUIRE(bearer.isValid());
    REQUIRE(bearer.ecc() == 0xE1);
    REQUIRE(bearer.eid() == 0xC181);
    REQUIRE(bearer.sid() == 0xC479);
    REQUIRE(bearer.scids() == 0);
    REQUIRE(bearer.gcc() == 0xCE1);
    REQUIRE(bearer.toUri() == QString("dab:ce1.c181.c479.0"));
    REQUIRE(bearer.radioDNSFqdn() == QString("0.c479.c181.ce1.dab.radiodns.org"));
    REQUIRE(bearer.pathSegment() == QString("dab/ce1/c181/c479/0"));
    REQUIRE(bearer.objectIdentifier() == QString("ce1.c181.c479.0"));

    SECTION("upper case and user application suffix")
    {
        DabBearer other = DabBearer::fromUri("DAB:CE1.C181.C479.0.004");
        REQUIRE(other == bearer);
    }
}

TEST_CASE("Invalid bearer URIs are rejected", "[bearer]")
{
    REQUIRE_FALSE(DabBearer::fromUri("fm:ce1.c479.09580").isValid());
    REQUIRE_FALSE(DabBearer::fromUri("dab:ce1.c181").isValid());
    REQUIRE_FALSE(DabBearer::fromUri("").isValid());
    REQUIRE_FALSE(DabBearer().isValid());
}

TEST_CASE("Bearer binary forms", "[bearer]")
{
    DabBearer bearer(0xE1, 0xC181, 0xC479, 2);

    SECTION("bearerURI encoding")
    {
        REQUIRE(bearer.toBinary() == QByteArray("\x02\xE1\xC1\x81\xC4\x79", 6));
    }
    SECTION("scope ID of programme information")
    {
        REQUIRE(bearer.scopeId() == QByteArray("\xE1\xC1\x81\xC4\x79\x02", 6));
    }
    SECTION("scope ID of service information")
    {
        REQUIRE(DabBearer::ensembleScopeId(0xE1, 0x1234) == QByteArray("\xE1\x12\x34", 3));
    }
    SECTION("long SId")
    {
        DabBearer data(0xE1, 0xC181, 0xE1C47900, 0);
        REQUIRE(data.isLongSId());
        REQUIRE(data.toBinary() == QByteArray("\x10\xE1\xC1\x81\xE1\xC4\x79\x00", 8));
        REQUIRE(data.gcc() == 0xCE1);
    }
}

TEST_CASE("Bearers of same multiplex", "[bearer]")
{
    DabBearer a(0xE1, 0x1234, 0xC479, 0);
    DabBearer b(0xE1, 0x1234, 0xC221, 0);
    DabBearer c(0xE0, 0x1234, 0xC479, 0);
    REQUIRE(a.isSameMultiplex(b));
    REQUIRE_FALSE(a.isSameMultiplex(c));
    REQUIRE(a.isSameMultiplex(0xE1, 0x1234));
    REQUIRE(a != b);
}

TEST_CASE("DAB time conversion", "[bearer]")
{
    QDateTime time(QDate(2024, 1, 1), QTime(6, 30), Qt::UTC);
    QByteArray shortForm = DabTables::utcToDabTime(time, false);
    REQUIRE(shortForm.size() == 4);

    uint32_t value = (uint32_t(uint8_t(shortForm[0])) << 24) | (uint32_t(uint8_t(shortForm[1])) << 16)
                     | (uint32_t(uint8_t(shortForm[2])) << 8) | uint8_t(shortForm[3]);
    // MJD of 2024-01-01 is 60310
    REQUIRE(((value >> 14) & 0x1FFFF) == 60310);
    // short form: no UTC flag, hours and minutes
    REQUIRE((value & (1 << 11)) == 0);
    REQUIRE(((value >> 6) & 0x1F) == 6);
    REQUIRE((value & 0x3F) == 30);

    QDateTime withSeconds(QDate(2024, 1, 1), QTime(6, 30, 15), Qt::UTC);
    QByteArray longForm = DabTables::utcToDabTime(withSeconds, true);
    REQUIRE(longForm.size() == 6);
    REQUIRE((uint8_t(longForm[2]) & 0x08) == 0x08);
    REQUIRE((uint8_t(longForm[4]) >> 2) == 15);
}
