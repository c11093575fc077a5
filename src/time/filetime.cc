//--------------------------------------------------------------------------
// Copyright (C) 2026-2026 Cisco and/or its affiliates. All rights reserved.
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License Version 2 as published
// by the Free Software Foundation.  You may not use, modify or distribute
// this program under any other version of the GNU General Public License.
//
// This program is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// General Public License for more details.
//
// You should have received a copy of the GNU General Public License along
// with this program; if not, write to the Free Software Foundation, Inc.,
// 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
//--------------------------------------------------------------------------

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "filetime.h"

#include <cmath>

using namespace smbwire;

#define SECS_PER_DAY 86400

static int64_t floor_div(int64_t a, int64_t b)
{
    int64_t q = a / b;
    if ( (a % b) and ((a < 0) != (b < 0)) )
        --q;
    return q;
}

// proleptic Gregorian calendar conversions, day 0 is 1970-01-01
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const int64_t era = floor_div(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d)
{
    z += 719468;
    const int64_t era = floor_div(z, 146097);
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    d = (unsigned)(doy - (153 * mp + 2) / 5 + 1);
    m = (unsigned)(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2);
}

FileTime FileTime::from_unix_seconds(int64_t secs, uint32_t nsec)
{
    uint64_t t = (uint64_t)(secs + FILETIME_EPOCH_DELTA) * FILETIME_TICKS_PER_SEC;
    return FileTime(t + nsec / FILETIME_NSEC_PER_TICK);
}

FileTime FileTime::from_unix_interval(double secs)
{
    double whole = std::floor(secs);
    double frac = secs - whole;
    int64_t extra = (int64_t)std::llround(frac * FILETIME_TICKS_PER_SEC);

    uint64_t t = (uint64_t)((int64_t)whole + FILETIME_EPOCH_DELTA) * FILETIME_TICKS_PER_SEC;
    return FileTime(t + extra);
}

FileTime FileTime::from_timeval(const struct timeval& tv)
{
    return from_unix_seconds(tv.tv_sec, (uint32_t)tv.tv_usec * 1000);
}

FileTime FileTime::from_calendar(const CalendarTime& c)
{
    int64_t days = days_from_civil(c.year, c.month, c.day);
    int64_t secs = days * SECS_PER_DAY + c.hour * 3600 + c.minute * 60 + c.second;
    return from_unix_seconds(secs, c.nanosecond);
}

int64_t FileTime::to_unix_seconds() const
{
    return (int64_t)(ticks / FILETIME_TICKS_PER_SEC) - FILETIME_EPOCH_DELTA;
}

double FileTime::to_unix_interval() const
{
    return (double)to_unix_seconds() + (double)(ticks % FILETIME_TICKS_PER_SEC) / FILETIME_TICKS_PER_SEC;
}

void FileTime::to_timeval(struct timeval& tv) const
{
    tv.tv_sec = (time_t)to_unix_seconds();
    tv.tv_usec = (suseconds_t)(nanoseconds() / 1000);
}

CalendarTime FileTime::to_calendar() const
{
    int64_t secs = to_unix_seconds();
    int64_t days = floor_div(secs, SECS_PER_DAY);
    int64_t rem = secs - days * SECS_PER_DAY;

    CalendarTime c;
    civil_from_days(days, c.year, c.month, c.day);
    c.hour = (unsigned)(rem / 3600);
    c.minute = (unsigned)((rem % 3600) / 60);
    c.second = (unsigned)(rem % 60);
    c.nanosecond = nanoseconds();
    return c;
}

