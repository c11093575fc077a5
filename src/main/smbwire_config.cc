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

#include "smbwire_config.h"

#include <atomic>

#include "log/messages.h"

using namespace smbwire;

static const CodecConfig s_default_conf;

// decoders on any thread read this while another may swap it
static std::atomic<const CodecConfig*> s_conf { &s_default_conf };

uint32_t CodecConfig::logging_flags = 0;

const CodecConfig* CodecConfig::get_conf()
{ return s_conf.load(std::memory_order_acquire); }

void CodecConfig::set_conf(const CodecConfig* c)
{ s_conf.store(c ? c : &s_default_conf, std::memory_order_release); }

void CodecConfig::show() const
{
    ConfigLogger::log_option("smbwire");
    ConfigLogger::log_value("max_chain_entries", max_chain_entries);
    ConfigLogger::log_value("default_output_length", default_output_length);
    ConfigLogger::log_limit("max_ioctl_output", max_ioctl_output, 0x7fffffffu);
    ConfigLogger::log_value("trace_level", (unsigned)trace_level);
    ConfigLogger::log_flag("quiet", log_quiet());
    ConfigLogger::log_flag("syslog", log_syslog());
}

#ifdef UNIT_TEST
#include "catch/smbwire_catch.h"

TEST_CASE("config defaults and override", "[config]")
{
    const CodecConfig* def = CodecConfig::get_conf();
    REQUIRE(def != nullptr);
    CHECK(def->max_chain_entries == 1000);
    CHECK(def->default_output_length == 65535);
    CHECK(def->trace_level == 0);

    CodecConfig mine;
    mine.max_chain_entries = 5;
    CodecConfig::set_conf(&mine);
    CHECK(CodecConfig::get_conf()->max_chain_entries == 5);

    CodecConfig::set_conf(nullptr);
    CHECK(CodecConfig::get_conf() == def);
}
#endif

