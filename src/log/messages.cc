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

#include "messages.h"

#include <syslog.h>

#include <cstdlib>

#include "main/smbwire_config.h"

using namespace smbwire;

static int already_fatal = 0;

static void WriteLogMessage(FILE* fh, bool prefer_fh, const char* format, va_list& ap)
{
    if ( prefer_fh or !CodecConfig::log_syslog() )
    {
        vfprintf(fh, format, ap);
        return;
    }
    char buf[STD_BUF+1];
    vsnprintf(buf, STD_BUF, format, ap);
    buf[STD_BUF] = '\0';
    syslog(LOG_DAEMON | LOG_NOTICE, "%s", buf);
}

namespace smbwire
{
// print an info message to stdout or syslog
void LogMessage(const char* format,...)
{
    if ( CodecConfig::log_quiet() )
        return;

    va_list ap;
    va_start(ap, format);

    WriteLogMessage(stdout, false, format, ap);

    va_end(ap);
}

void LogMessage(FILE* fh, const char* format,...)
{
    if ( fh == stdout and CodecConfig::log_quiet() )
        return;

    va_list ap;
    va_start(ap, format);

    WriteLogMessage(fh, (fh != stdout && fh != stderr), format, ap);

    va_end(ap);
}

// print a warning message to stderr or syslog
void WarningMessage(const char* format, va_list& ap)
{
    if ( CodecConfig::log_syslog() )
    {
        char buf[STD_BUF+1];
        vsnprintf(buf, STD_BUF, format, ap);
        buf[STD_BUF] = '\0';
        syslog(LOG_DAEMON | LOG_WARNING, "%s", buf);
    }
    else
    {
        vfprintf(stderr, format, ap);
    }
}

void WarningMessage(const char* format, ...)
{
    va_list ap;
    va_start(ap, format);

    WarningMessage(format, ap);

    va_end(ap);
}

// print an error message to stderr or syslog
void ErrorMessage(const char* format, va_list& ap)
{
    if ( CodecConfig::log_syslog() )
    {
        char buf[STD_BUF+1];
        vsnprintf(buf, STD_BUF, format, ap);
        buf[STD_BUF] = '\0';
        syslog(LOG_CONS | LOG_DAEMON | LOG_ERR, "%s", buf);
    }
    else
    {
        vfprintf(stderr, format, ap);
    }
}

void ErrorMessage(const char* format,...)
{
    va_list ap;

    va_start(ap, format);

    ErrorMessage(format, ap);

    va_end(ap);
}

[[noreturn]] void FatalError(const char* format,...)
{
    char buf[STD_BUF+1];
    va_list ap;

    // bail now if we are reentering
    if ( already_fatal )
        exit(1);
    else
        already_fatal = 1;

    va_start(ap, format);
    vsnprintf(buf, STD_BUF, format, ap);
    va_end(ap);

    buf[STD_BUF] = '\0';

    if ( CodecConfig::log_syslog() )
        syslog(LOG_CONS | LOG_DAEMON | LOG_ERR, "FATAL ERROR: %s", buf);
    else
        fprintf(stderr, "FATAL: %s", buf);

    exit(EXIT_FAILURE);
}
}

// captions are right aligned in a column of this width
static constexpr int caption_width = 25;

void ConfigLogger::log_option(const char* caption)
{
    LogMessage("%*s:\n", caption_width, caption);
}

bool ConfigLogger::log_flag(const char* caption, bool flag)
{
    LogMessage("%*s: %s\n", caption_width, caption, flag ? "enabled" : "disabled");
    return flag;
}

void ConfigLogger::log_limit(const char* caption, unsigned val, unsigned unlim)
{
    LogMessage("%*s: %u%s\n", caption_width, caption, val, val == unlim ? " (unlimited)" : "");
}

void ConfigLogger::log_value(const char* caption, unsigned n)
{
    LogMessage("%*s: %u\n", caption_width, caption, n);
}
