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

#ifndef SCOPECALCULATOR_H
#define SCOPECALCULATOR_H

#include <QDateTime>

#include "spidocument.h"

struct ScheduleScope
{
    QDateTime start;
    QDateTime end;

    bool isValid() const { return start.isValid() && end.isValid(); }
};

class ScopeCalculator
{
public:
    // declared bounds are used verbatim, missing ones are derived from programme times
    static ScheduleScope scheduleScope(const SPISchedule & schedule);
    static ScheduleScope merge(const ScheduleScope & a, const ScheduleScope & b);
    static ScheduleScope documentScope(const SPIProgrammeInformation & pi);

    // all schedules get the aggregate scope and the single bearer as service scope
    static SPIProgrammeInformation applyScope(const SPIProgrammeInformation & pi, const ScheduleScope & scope, const DabBearer & bearer);

    // programme without short description gets first long description that fits in maxLength
    static SPIProgrammeInformation backfillShortDescriptions(const SPIProgrammeInformation & pi, int maxLength);
};

#endif // SCOPECALCULATOR_H
