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

// nt_status_test.cc
// unit tests for the NTSTATUS name table

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "protocols/smb2/nt_status.h"
#include "protocols/smb2/smb2_header.h"

#include <cstring>

#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/TestHarness.h>

using namespace smbwire::smb2;

TEST_GROUP(nt_status)
{
};

TEST(nt_status, table_is_sorted)
{
    // aborts the runner if the table is out of order
    nt_status_verify();

    CHECK(nt_status_count() > 100);

    for ( unsigned i = 1; i < nt_status_count(); ++i )
        CHECK(nt_status_code(i - 1) < nt_status_code(i));

    UNSIGNED_LONGS_EQUAL(0, nt_status_code(nt_status_count()));
}

TEST(nt_status, every_code_has_a_name)
{
    for ( unsigned i = 0; i < nt_status_count(); ++i )
    {
        uint32_t code = nt_status_code(i);
        CHECK(strlen(nt_status_name(code)) > 7);
        CHECK(!strncmp(nt_status_name(code), "STATUS_", 7));
        CHECK(*nt_status_description(code));
    }
}

TEST(nt_status, lookups)
{
    STRCMP_EQUAL("STATUS_SUCCESS", nt_status_name(STATUS_SUCCESS));
    STRCMP_EQUAL("STATUS_PENDING", nt_status_name(STATUS_PENDING));
    STRCMP_EQUAL("STATUS_ACCESS_DENIED", nt_status_name(STATUS_ACCESS_DENIED));
    STRCMP_EQUAL("STATUS_NO_MORE_FILES", nt_status_name(STATUS_NO_MORE_FILES));
    STRCMP_EQUAL("STATUS_MORE_PROCESSING_REQUIRED",
        nt_status_name(STATUS_MORE_PROCESSING_REQUIRED));
}

TEST(nt_status, unknown_code)
{
    STRCMP_EQUAL("", nt_status_name(0xC0FFEE00));
    STRCMP_EQUAL("", nt_status_description(0xC0FFEE00));
}

TEST(nt_status, severity)
{
    StatusDetails d = decompose_status(STATUS_BUFFER_OVERFLOW);
    CHECK(STATUS_SEVERITY_WARNING == d.severity);
    CHECK(!d.customer);
    UNSIGNED_LONGS_EQUAL(5, d.code);

    d = decompose_status(STATUS_END_OF_FILE);
    CHECK(STATUS_SEVERITY_ERROR == d.severity);
    UNSIGNED_LONGS_EQUAL(0x11, d.code);
}

int main(int argc, char** argv)
{
    return CommandLineTestRunner::RunAllTests(argc, argv);
}
