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

#include "scopecalculator.h"

Q_LOGGING_CATEGORY(scopeCalculator, "ScopeCalculator", QtInfoMsg)

namespace
{
QDateTime earlier(const QDateTime & a, const QDateTime & b)
{
    if (!a.isValid())
    {
        return b;
    }
    if (!b.isValid())
    {
        return a;
    }
    return (b < a) ? b : a;
}

QDateTime later(const QDateTime & a, const QDateTime & b)
{
    if (!a.isValid())
    {
        return b;
    }
    if (!b.isValid())
    {
        return a;
    }
    return (b > a) ? b : a;
}
}

ScheduleScope ScopeCalculator::scheduleScope(const SPISchedule &schedule)
{
    ScheduleScope scope;
    scope.start = schedule.scope.start;
    scope.end = schedule.scope.stop;
    if (scope.isValid())
    {
        return scope;
    }

    QDateTime minStart;
    QDateTime maxEnd;
    for (const SPIProgramme & programme : schedule.programmes)
    {
        for (const SPILocation & location : programme.locations)
        {
            for (const SPITime & time : location.times)
            {
                QDateTime start = time.effectiveTime();
                if (!start.isValid())
                {
                    continue;
                }
                int duration = qMax(0, time.effectiveDurationSec());
                minStart = earlier(minStart, start);
                maxEnd = later(maxEnd, start.addSecs(duration));
            }
        }
    }

    if (!scope.start.isValid())
    {
        scope.start = minStart;
    }
    if (!scope.end.isValid())
    {
        scope.end = maxEnd;
    }

    qCDebug(scopeCalculator) << "Schedule scope" << scope.start << "-" << scope.end;
    return scope;
}

ScheduleScope ScopeCalculator::merge(const ScheduleScope &a, const ScheduleScope &b)
{
    ScheduleScope scope;
    scope.start = earlier(a.start, b.start);
    scope.end = later(a.end, b.end);
    return scope;
}

ScheduleScope ScopeCalculator::documentScope(const SPIProgrammeInformation &pi)
{
    ScheduleScope scope;
    for (const SPISchedule & schedule : pi.schedules)
    {
        scope = merge(scope, scheduleScope(schedule));
    }
    return scope;
}

SPIProgrammeInformation ScopeCalculator::applyScope(const SPIProgrammeInformation &pi, const ScheduleScope &scope, const DabBearer &bearer)
{
    SPIProgrammeInformation result = pi;
    for (SPISchedule & schedule : result.schedules)
    {
        schedule.scope.start = scope.start;
        schedule.scope.stop = scope.end;
        schedule.scope.serviceScopes = { bearer };
    }
    return result;
}

SPIProgrammeInformation ScopeCalculator::backfillShortDescriptions(const SPIProgrammeInformation &pi, int maxLength)
{
    SPIProgrammeInformation result = pi;
    for (SPISchedule & schedule : result.schedules)
    {
        for (SPIProgramme & programme : schedule.programmes)
        {
            if (!programme.mediaDescription.shortDescriptions.isEmpty())
            {
                continue;
            }
            for (const SPIText & description : programme.mediaDescription.longDescriptions)
            {
                if (description.text.length() <= maxLength)
                {
                    programme.mediaDescription.shortDescriptions.append(description);
                    break;
                }
            }
        }
    }
    return result;
}
