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

// smbwire_unit_test [tag ...]
// each argument is a Catch test name or tag expression; none runs all tests

#include "catch/unit_test.h"
#include "protocols/smb2/nt_status.h"

int main(int argc, char* argv[])
{
    smbwire::smb2::nt_status_verify();

    if ( argc < 2 )
        catch_set_filter("all");

    for ( int i = 1; i < argc; ++i )
        catch_set_filter(argv[i]);

    return catch_test() ? 1 : 0;
}

