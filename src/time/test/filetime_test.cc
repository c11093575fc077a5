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

#include "catch/smbwire_catch.h"

#include "time/filetime.h"

using namespace smbwire;

TEST_CASE( "unix epoch", "[filetime]" )
{
    FileTime t = FileTime::from_unix_seconds(0);

    CHECK( (t.get_ticks() == 116444736000000000ULL) );
    CHECK( (t.to_unix_seconds() == 0) );
    CHECK( (t.nanoseconds() == 0) );
    CHECK_FALSE( t.is_zero() );
    CHECK( FileTime().is_zero() );
}

TEST_CASE( "unix seconds", "[filetime]" )
{
    SECTION( "after 1970" )
    {
        FileTime t = FileTime::from_unix_seconds(946684800, 250000000);
        CHECK( (t.get_ticks() == 125911584002500000ULL) );
        CHECK( (t.to_unix_seconds() == 946684800) );
        CHECK( (t.nanoseconds() == 250000000) );
    }
    SECTION( "before 1970" )
    {
        FileTime t = FileTime::from_unix_seconds(-86400);
        CHECK( (t.to_unix_seconds() == -86400) );

        CalendarTime c = t.to_calendar();
        CHECK( (c.year == 1969) );
        CHECK( (c.month == 12) );
        CHECK( (c.day == 31) );
    }
    SECTION( "nanoseconds below a tick are dropped" )
    {
        FileTime t = FileTime::from_unix_seconds(1, 199);
        CHECK( (t.nanoseconds() == 100) );
    }
}

TEST_CASE( "floating point interval", "[filetime]" )
{
    FileTime t = FileTime::from_unix_interval(1.5);
    CHECK( (t.to_unix_seconds() == 1) );
    CHECK( (t.nanoseconds() == 500000000) );
    CHECK( (t.to_unix_interval() == Approx(1.5)) );

    FileTime n = FileTime::from_unix_interval(-0.25);
    CHECK( (n.to_unix_seconds() == -1) );
    CHECK( (n.nanoseconds() == 750000000) );
}

TEST_CASE( "timeval", "[filetime]" )
{
    struct timeval tv;
    tv.tv_sec = 1700000000;
    tv.tv_usec = 123456;

    FileTime t = FileTime::from_timeval(tv);

    struct timeval back;
    t.to_timeval(back);
    CHECK( (back.tv_sec == tv.tv_sec) );
    CHECK( (back.tv_usec == tv.tv_usec) );
}

TEST_CASE( "calendar", "[filetime]" )
{
    SECTION( "file time origin" )
    {
        CalendarTime c = FileTime(0).to_calendar();
        CHECK( (c.year == 1601) );
        CHECK( (c.month == 1) );
        CHECK( (c.day == 1) );
        CHECK( (c.hour == 0) );
    }
    SECTION( "leap day" )
    {
        CalendarTime c { 2024, 2, 29, 13, 45, 30, 100 };
        FileTime t = FileTime::from_calendar(c);
        CalendarTime back = t.to_calendar();

        CHECK( (back.year == 2024) );
        CHECK( (back.month == 2) );
        CHECK( (back.day == 29) );
        CHECK( (back.hour == 13) );
        CHECK( (back.minute == 45) );
        CHECK( (back.second == 30) );
        CHECK( (back.nanosecond == 100) );
        CHECK( (t.to_unix_seconds() == 1709214330) );
    }
}

TEST_CASE( "ordering", "[filetime]" )
{
    FileTime a(10), b(20);

    CHECK( a < b );
    CHECK( (a != b) );
    CHECK( (FileTime::from_ticks(10) == a) );
}

