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

#include "trace.h"

#include "log/messages.h"
#include "main/smbwire_config.h"

namespace smbwire
{
bool trace_enabled(TraceLevel log_level)
{
    const CodecConfig* conf = CodecConfig::get_conf();
    return conf->trace_level and log_level <= conf->trace_level;
}

void trace_logf(TraceLevel log_level, const char* module, const char* fmt, ...)
{
    char buf[STD_BUF+1];
    va_list ap;

    va_start(ap, fmt);
    vsnprintf(buf, STD_BUF, fmt, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';
    LogMessage(stderr, "%s:%u: %s\n", module, (unsigned)log_level, buf);
}
}


#ifdef UNIT_TEST
#include "catch/smbwire_catch.h"

using namespace smbwire;

TEST_CASE("trace threshold", "[trace]")
{
    CHECK_FALSE(trace_enabled(TRACE_ERROR_LEVEL));

    CodecConfig conf;
    conf.trace_level = TRACE_WARNING_LEVEL;
    CodecConfig::set_conf(&conf);

    CHECK(trace_enabled(TRACE_ERROR_LEVEL));
    CHECK(trace_enabled(TRACE_WARNING_LEVEL));
    CHECK_FALSE(trace_enabled(TRACE_DEBUG_LEVEL));

    CodecConfig::set_conf(nullptr);
    CHECK_FALSE(trace_enabled(TRACE_CRITICAL_LEVEL));
}
#endif
