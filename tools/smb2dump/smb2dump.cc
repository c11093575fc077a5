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
// smb2dump.cc prints the SMB2 messages held in raw capture files

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "log/messages.h"
#include "main/smbwire_config.h"
#include "protocols/smb2/nt_status.h"
#include "protocols/smb2/smb2_create.h"
#include "protocols/smb2/smb2_file_io.h"
#include "protocols/smb2/smb2_ioctl.h"
#include "protocols/smb2/smb2_negotiate.h"
#include "protocols/smb2/smb2_notify.h"
#include "protocols/smb2/smb2_query.h"
#include "protocols/smb2/smb2_tree.h"

#ifdef UNIT_TEST
#include "catch/unit_test.h"
#endif

using namespace smbwire;
using namespace smbwire::smb2;

#define FAILURE 1
#define SUCCESS 0

static std::string time_str(FileTime t)
{
    if ( t.is_zero() )
        return "0";

    CalendarTime c = t.to_calendar();
    char buf[64];

    snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02u:%02u:%02u",
        (long long)c.year, c.month, c.day, c.hour, c.minute, c.second);

    return buf;
}

static std::string guid_str(const Guid& g)
{
    char buf[2 * 16 + 1];

    for ( unsigned i = 0; i < g.size(); ++i )
        snprintf(buf + 2 * i, 3, "%02x", g[i]);

    return buf;
}

static void show_file_id(const FileId& id)
{
    LogMessage("    file id: %016llx:%016llx\n",
        (unsigned long long)id.persistent, (unsigned long long)id.volatile_id);
}

static void show_dialects(const std::vector<uint16_t>& dialects)
{
    LogMessage("    dialects:");

    for ( auto d : dialects )
        LogMessage(" 0x%04x", d);

    LogMessage("\n");
}

static void show_header(const Header& h, unsigned index, uint32_t length)
{
    LogMessage("%s\n", LOG_DIV);
    LogMessage("message %u: %s %s, %u bytes\n", index, command_name(h.command),
        h.is_response() ? "response" : "request", length);

    LogMessage("    message id: %llu  credits: %u  charge: %u\n",
        (unsigned long long)h.message_id, h.credit, h.credit_charge);

    if ( h.is_async() )
        LogMessage("    async id: %llu", (unsigned long long)h.get_async_id());
    else
        LogMessage("    tree id: %u", h.get_tree_id());

    LogMessage("  session id: 0x%016llx\n", (unsigned long long)h.session_id);

    LogMessage("    flags: 0x%08x%s%s%s  priority: %u  next: %u\n", h.flags.raw(),
        h.is_related() ? " related" : "", h.is_signed() ? " signed" : "",
        h.is_async() ? " async" : "", h.get_priority(), h.next_command);

    if ( !h.is_response() )
        return;

    StatusDetails d = h.status_details();
    const char* name = nt_status_name(h.status);

    LogMessage("    status: 0x%08x %s (severity %u, facility 0x%03x, code 0x%04x)\n",
        h.status, *name ? name : "unknown", (unsigned)d.severity, d.facility, d.code);

    if ( *name )
        LogMessage("        %s\n", nt_status_description(h.status));
}

//-------------------------------------------------------------------------
// requests
//-------------------------------------------------------------------------

static void show(const NegotiateRequest& req)
{
    show_dialects(req.dialects);
    LogMessage("    client guid: %s  security mode: 0x%x  capabilities: 0x%x\n",
        guid_str(req.client_guid).c_str(), req.security_mode.raw(), req.capabilities.raw());

    for ( const auto& c : req.contexts )
        LogMessage("    context type %u, %zu bytes\n", c.type, c.data.size());
}

static void show(const SessionSetupRequest& req)
{
    LogMessage("    security mode: 0x%x  token: %zu bytes\n", req.security_mode.raw(),
        req.security_buffer.size());
}

static void show(const TreeConnectRequest& req)
{ LogMessage("    path: %s\n", req.path.c_str()); }

static void show(const CreateRequest& req)
{
    LogMessage("    name: \"%s\"\n", req.name.c_str());
    LogMessage("    access: 0x%08x  share: 0x%x  disposition: %u  options: 0x%08x\n",
        req.desired_access.raw(), req.share_access.raw(), (unsigned)req.create_disposition,
        req.create_options.raw());

    for ( const auto& c : req.contexts )
        LogMessage("    context %s, %zu bytes\n", c.name.c_str(), c.data.size());
}

static void show(const CloseRequest& req)
{ show_file_id(req.file_id); }

static void show(const FlushRequest& req)
{ show_file_id(req.file_id); }

static void show(const ReadRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    offset: %llu  length: %u\n", (unsigned long long)req.offset, req.length);
}

static void show(const WriteRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    offset: %llu  length: %zu\n", (unsigned long long)req.offset,
        req.data.size());
}

static void show(const LockRequest& req)
{
    show_file_id(req.file_id);

    for ( const auto& l : req.locks )
        LogMessage("    lock %llu+%llu flags 0x%x\n", (unsigned long long)l.offset,
            (unsigned long long)l.length, l.flags.raw());
}

static void show(const IoctlRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    control code: 0x%08x  input: %zu bytes  max output: %u\n",
        req.ctl_code, req.input.size(), req.max_output_response);
}

static void show(const QueryDirectoryRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    %s \"%s\" flags 0x%x\n", file_info_class_name(req.info_class),
        req.pattern.c_str(), req.flags.raw());
}

static void show(const ChangeNotifyRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    filter: 0x%08x  flags: 0x%x\n", req.completion_filter.raw(),
        req.flags.raw());
}

static const char* info_class_name(uint8_t info_type, uint8_t info_class)
{
    switch ( info_type )
    {
    case SMB2_0_INFO_FILE:
        return file_info_class_name(info_class);
    case SMB2_0_INFO_FILESYSTEM:
        return fs_info_class_name(info_class);
    case SMB2_0_INFO_SECURITY:
        return "security";
    case SMB2_0_INFO_QUOTA:
        return "quota";
    }
    return "unknown";
}

static void show(const QueryInfoRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    %s  output length: %u  additional: 0x%x\n",
        info_class_name(req.info_type, req.info_class), req.output_buffer_length,
        req.additional_information);
}

static void show(const SetInfoRequest& req)
{
    show_file_id(req.file_id);
    LogMessage("    %s  %zu bytes\n", info_class_name(req.info_type, req.info_class),
        req.buffer.size());
}

//-------------------------------------------------------------------------
// responses
//-------------------------------------------------------------------------

static void show(const NegotiateResponse& rsp)
{
    LogMessage("    dialect: 0x%04x  server guid: %s\n", rsp.dialect_revision,
        guid_str(rsp.server_guid).c_str());
    LogMessage("    capabilities: 0x%x  max transact/read/write: %u/%u/%u\n",
        rsp.capabilities.raw(), rsp.max_transact_size, rsp.max_read_size, rsp.max_write_size);
    LogMessage("    system time: %s\n", time_str(rsp.system_time).c_str());
    LogMessage("    security blob: %zu bytes\n", rsp.security_buffer.size());

    for ( const auto& c : rsp.contexts )
        LogMessage("    context type %u, %zu bytes\n", c.type, c.data.size());
}

static void show(const SessionSetupResponse& rsp)
{
    LogMessage("    session flags: 0x%x%s%s  token: %zu bytes\n", rsp.session_flags.raw(),
        rsp.is_guest() ? " guest" : "", rsp.is_null() ? " null" : "",
        rsp.security_buffer.size());
}

static void show(const TreeConnectResponse& rsp)
{
    LogMessage("    share type: %u  flags: 0x%08x  capabilities: 0x%x  access: 0x%08x\n",
        (unsigned)rsp.share_type, rsp.share_flags.raw(), rsp.capabilities.raw(),
        rsp.maximal_access.raw());
}

static void show(const CreateResponse& rsp)
{
    show_file_id(rsp.file_id);
    LogMessage("    action: %u  oplock: 0x%02x  size: %llu  attributes: 0x%08x\n",
        (unsigned)rsp.create_action, rsp.oplock_level, (unsigned long long)rsp.end_of_file,
        rsp.file_attributes.raw());
    LogMessage("    modified: %s\n", time_str(rsp.times.last_write).c_str());

    for ( const auto& c : rsp.contexts )
        LogMessage("    context %s, %zu bytes\n", c.name.c_str(), c.data.size());
}

static void show(const CloseResponse& rsp)
{
    if ( rsp.flags & SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB )
        LogMessage("    size: %llu  attributes: 0x%08x\n",
            (unsigned long long)rsp.end_of_file, rsp.file_attributes.raw());
}

static void show(const ReadResponse& rsp)
{ LogMessage("    data: %zu bytes  remaining: %u\n", rsp.data.size(), rsp.data_remaining); }

static void show(const WriteResponse& rsp)
{ LogMessage("    written: %u bytes\n", rsp.count); }

static void show(const IoctlResponse& rsp)
{
    show_file_id(rsp.file_id);
    LogMessage("    control code: 0x%08x  output: %zu bytes\n", rsp.ctl_code,
        rsp.output.size());

    switch ( rsp.payload )
    {
    case IOCTL_PAYLOAD_COPYCHUNK:
        LogMessage("    chunks written: %u  total bytes: %u\n",
            rsp.copychunk.chunks_written, rsp.copychunk.total_bytes_written);
        break;

    case IOCTL_PAYLOAD_SNAPSHOTS:
        LogMessage("    snapshots: %u\n", rsp.snapshots.number_of_snapshots);
        for ( const auto& t : rsp.snapshots.tokens )
            LogMessage("        %s\n", t.c_str());
        break;

    case IOCTL_PAYLOAD_NETWORK_INTERFACES:
        for ( const auto& ni : rsp.interfaces )
            LogMessage("    interface %u: %s port %u, %llu bit/s\n", ni.if_index,
                ni.address_string().c_str(), ni.port, (unsigned long long)ni.link_speed);
        break;

    case IOCTL_PAYLOAD_VALIDATE_NEGOTIATE:
        LogMessage("    dialect: 0x%04x  server guid: %s\n", rsp.validate_negotiate.dialect,
            guid_str(rsp.validate_negotiate.server_guid).c_str());
        break;

    case IOCTL_PAYLOAD_RESUME_KEY:
    case IOCTL_PAYLOAD_NONE:
        break;
    }
}

// the class is in the request, so try the richest one servers commonly use
static void show(const QueryDirectoryResponse& rsp)
{
    std::vector<DirectoryEntry> entries;
    rsp.entries(FILE_ID_BOTH_DIRECTORY_INFORMATION, entries);

    LogMessage("    output: %zu bytes\n", rsp.output.size());

    for ( const auto& e : entries )
        LogMessage("    %s %12lld  %s\n", e.is_directory() ? "d" : "-",
            (long long)e.end_of_file, e.name.c_str());
}

static void show(const QueryInfoResponse& rsp)
{ LogMessage("    output: %zu bytes\n", rsp.output.size()); }

static void show(const ChangeNotifyResponse& rsp)
{
    for ( const auto& n : rsp.notifications )
        LogMessage("    %s: %s\n", notify_action_name(n.action), n.name.c_str());
}

// bodies with nothing past the header
template<typename T>
static void show(const T&)
{ }

//-------------------------------------------------------------------------
// dispatch
//-------------------------------------------------------------------------

template<typename Req>
static void dump_request(const MessageSpan& m)
{
    Header h;
    Req req;

    if ( decode_message(m.data, m.length, h, req) )
        show(req);
    else
        LogMessage("    body did not decode\n");
}

template<typename Rsp>
static void dump_response(const MessageSpan& m)
{
    Header h;
    Rsp rsp;
    ErrorResponse err;

    switch ( decode_response(m.data, m.length, h, rsp, err) )
    {
    case DECODE_BODY:
        show(rsp);
        break;

    case DECODE_ERROR_BODY:
        LogMessage("    error response: %u contexts, %zu data bytes\n",
            err.error_context_count, err.error_data.size());
        break;

    case DECODE_FAILED:
        LogMessage("    body did not decode\n");
        break;
    }
}

template<typename Req, typename Rsp>
static void dump(const MessageSpan& m, bool requests)
{
    if ( requests )
        dump_request<Req>(m);
    else
        dump_response<Rsp>(m);
}

static void dump_body(const Header& h, const MessageSpan& m, bool requests)
{
    switch ( h.command )
    {
    case SMB2_COM_NEGOTIATE:
        dump<NegotiateRequest, NegotiateResponse>(m, requests);
        break;
    case SMB2_COM_SESSION_SETUP:
        dump<SessionSetupRequest, SessionSetupResponse>(m, requests);
        break;
    case SMB2_COM_LOGOFF:
        dump<LogoffRequest, LogoffResponse>(m, requests);
        break;
    case SMB2_COM_TREE_CONNECT:
        dump<TreeConnectRequest, TreeConnectResponse>(m, requests);
        break;
    case SMB2_COM_TREE_DISCONNECT:
        dump<TreeDisconnectRequest, TreeDisconnectResponse>(m, requests);
        break;
    case SMB2_COM_CREATE:
        dump<CreateRequest, CreateResponse>(m, requests);
        break;
    case SMB2_COM_CLOSE:
        dump<CloseRequest, CloseResponse>(m, requests);
        break;
    case SMB2_COM_FLUSH:
        dump<FlushRequest, FlushResponse>(m, requests);
        break;
    case SMB2_COM_READ:
        dump<ReadRequest, ReadResponse>(m, requests);
        break;
    case SMB2_COM_WRITE:
        dump<WriteRequest, WriteResponse>(m, requests);
        break;
    case SMB2_COM_LOCK:
        dump<LockRequest, LockResponse>(m, requests);
        break;
    case SMB2_COM_IOCTL:
        dump<IoctlRequest, IoctlResponse>(m, requests);
        break;
    case SMB2_COM_CANCEL:
        if ( requests )
            dump_request<CancelRequest>(m);
        break;
    case SMB2_COM_ECHO:
        dump<EchoRequest, EchoResponse>(m, requests);
        break;
    case SMB2_COM_QUERY_DIRECTORY:
        dump<QueryDirectoryRequest, QueryDirectoryResponse>(m, requests);
        break;
    case SMB2_COM_CHANGE_NOTIFY:
        dump<ChangeNotifyRequest, ChangeNotifyResponse>(m, requests);
        break;
    case SMB2_COM_QUERY_INFO:
        dump<QueryInfoRequest, QueryInfoResponse>(m, requests);
        break;
    case SMB2_COM_SET_INFO:
        dump<SetInfoRequest, SetInfoResponse>(m, requests);
        break;
    default:
        LogMessage("    no decoder for this command\n");
        break;
    }
}

static bool read_file(const char* filename, Buffer& out)
{
    FILE* f = fopen(filename, "rb");

    if ( !f )
    {
        ErrorMessage("can't open %s: %s\n", filename, strerror(errno));
        return false;
    }

    uint8_t chunk[4096];
    size_t n;

    while ( (n = fread(chunk, 1, sizeof(chunk), f)) > 0 )
        out.insert(out.end(), chunk, chunk + n);

    bool ok = !ferror(f);

    if ( !ok )
        ErrorMessage("can't read %s: %s\n", filename, strerror(errno));

    fclose(f);
    return ok;
}

static int dump_file(const char* filename, bool requests)
{
    Buffer buf;

    if ( !read_file(filename, buf) )
        return FAILURE;

    LogMessage("%s: %zu bytes\n", filename, buf.size());

    std::vector<MessageSpan> spans;
    split_compound(buf.data(), (uint32_t)buf.size(), spans);

    if ( spans.empty() )
    {
        ErrorMessage("%s: no SMB2 message found\n", filename);
        return FAILURE;
    }

    size_t used = 0;

    for ( const auto& s : spans )
        used += s.length;

    if ( used < buf.size() )
        WarningMessage("%s: compound chain stops at byte %zu of %zu\n", filename, used,
            buf.size());

    for ( unsigned i = 0; i < spans.size(); ++i )
    {
        Header h;

        if ( !h.decode(spans[i].data, spans[i].length) )
            continue;

        show_header(h, i, spans[i].length);
        dump_body(h, spans[i], requests);
    }
    return SUCCESS;
}

static void usage()
{
    fprintf(stderr, "Usage: smb2dump [-r] [-q] [-v] [-t level] <file> ...\n");
    fprintf(stderr, "    -r        decode the messages as requests\n");
    fprintf(stderr, "    -q        quiet, no output but errors\n");
    fprintf(stderr, "    -v        show the codec settings\n");
    fprintf(stderr, "    -t level  trace decoder rejections at this level (1-7)\n");
#ifdef UNIT_TEST
    fprintf(stderr, "       smb2dump --catch-test [tag]\n");
#endif
}

int main(int argc, char* argv[])
{
    static CodecConfig conf;

    bool requests = false;
    bool verbose = false;
    int c;

#ifdef UNIT_TEST
    if ( argc > 1 and !strcmp(argv[1], "--catch-test") )
    {
        nt_status_verify();
        catch_set_filter(argc > 2 ? argv[2] : "all");
        return catch_test() ? FAILURE : SUCCESS;
    }
#endif

    opterr = 0;

    while ( (c = getopt(argc, argv, "rqvt:")) != -1 )
    {
        switch ( c )
        {
        case 'r':
            requests = true;
            break;
        case 'q':
            CodecConfig::set_log_quiet(true);
            break;
        case 'v':
            verbose = true;
            CodecConfig::enable_log_verbose();
            break;
        case 't':
            conf.trace_level = (uint8_t)strtoul(optarg, nullptr, 10);
            break;
        case '?':
            if ( optopt == 't' )
                fprintf(stderr, "Option -%c requires an argument.\n", optopt);
            else if ( isprint(optopt) )
                fprintf(stderr, "Unknown option -%c.\n", optopt);
            usage();
            return FAILURE;
        }
    }

    if ( optind >= argc )
    {
        usage();
        return FAILURE;
    }

    nt_status_verify();
    CodecConfig::set_conf(&conf);

    if ( verbose )
        conf.show();

    int rc = SUCCESS;

    for ( int i = optind; i < argc; ++i )
    {
        if ( dump_file(argv[i], requests) != SUCCESS )
            rc = FAILURE;
    }

    return rc;
}
