#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "proto/apdu.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace
{

static bool is_hex_byte(const std::string &s)
{
    if (s.size() != 2)
        return false;
    return std::isxdigit(static_cast<unsigned char>(s[0])) &&
           std::isxdigit(static_cast<unsigned char>(s[1]));
}

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  apdulinkctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  list\n"
                         "  open <id>\n"
                         "  exchange <id> <hex>\n"
                         "  apdu <id> <cla> <ins> <p1> <p2> [data-hex]\n"
                         "  close <id>\n"
                         "  disconnect <id>\n"
                         "  status\n"
                         "  quit\n");
}

// Sends one request; on OK, `payload` holds the reply text after "OK ".
static int query_line(const std::string &sock, const std::string &line, std::string &payload)
{
    payload.clear();
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::request(sock, line, reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (reply == "OK" || reply.rfind("OK ", 0) == 0)
    {
        if (reply.size() > 3)
            payload = reply.substr(3);
        return exitc::ok;
    }
    std::fprintf(stderr, "%s\n", reply.empty() ? "error: empty reply" : reply.c_str());
    return exitc::failed;
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    std::string payload;
    int         rc = query_line(sock, line, payload);
    if (rc == exitc::ok && !payload.empty())
        std::printf("%s\n", payload.c_str());
    return rc;
}

// Prints "<body hex> sw=XXXX"; any status word but 90 00 is a failure.
static int show_apdu_response(const std::string &payload)
{
    std::vector<std::uint8_t> resp;
    std::vector<std::uint8_t> body;
    std::uint16_t             sw = 0;
    if (!hex::decode(payload, resp) || !apdu::split_status(resp, body, sw))
    {
        std::fprintf(stderr, "error: response without status word: %s\n", payload.c_str());
        return exitc::failed;
    }
    std::printf("%s%ssw=%04x\n", hex::encode(body).c_str(), body.empty() ? "" : " ",
                static_cast<unsigned>(sw));
    return sw == apdu::SW_OK ? exitc::ok : exitc::failed;
}

static int run_cmd(const std::string                                           &cmd,
                   const std::vector<std::string>                              &args,
                   const std::function<int(const std::string &)>               &send_line,
                   const std::function<int(const std::string &, std::string &)> &query)
{
    auto need = [&](size_t n) -> bool {
        if (args.size() == n)
            return true;
        print_usage();
        return false;
    };
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"list", [&]() -> int { return send_line("LIST"); }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"open",
         [&]() -> int {
             if (!need(2))
                 return exitc::bad_args;
             return send_line("OPEN " + args[1]);
         }},
        {"exchange",
         [&]() -> int {
             if (args.size() < 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string payload;
             for (size_t i = 2; i < args.size(); ++i)
                 payload += args[i];
             std::vector<std::uint8_t> bytes;
             if (!hex::decode(payload, bytes) || bytes.empty())
             {
                 std::fprintf(stderr, "error: invalid hex payload: %s\n", payload.c_str());
                 return exitc::bad_args;
             }
             return send_line("EXCHANGE " + args[1] + " " + hex::encode(bytes));
         }},
        {"apdu",
         [&]() -> int {
             if (args.size() != 6 && args.size() != 7)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             for (size_t i = 2; i < 6; ++i)
             {
                 if (!is_hex_byte(args[i]))
                 {
                     std::fprintf(stderr, "error: header byte must be two hex digits: %s\n",
                                  args[i].c_str());
                     return exitc::bad_args;
                 }
             }
             apdu::Command c;
             c.cla = static_cast<std::uint8_t>(std::strtoul(args[2].c_str(), nullptr, 16));
             c.ins = static_cast<std::uint8_t>(std::strtoul(args[3].c_str(), nullptr, 16));
             c.p1  = static_cast<std::uint8_t>(std::strtoul(args[4].c_str(), nullptr, 16));
             c.p2  = static_cast<std::uint8_t>(std::strtoul(args[5].c_str(), nullptr, 16));
             if (args.size() == 7 && !hex::decode(args[6], c.data))
             {
                 std::fprintf(stderr, "error: invalid hex data: %s\n", args[6].c_str());
                 return exitc::bad_args;
             }
             std::vector<std::uint8_t> raw;
             if (!apdu::build(c, raw))
             {
                 std::fprintf(stderr, "error: data longer than %zu bytes\n",
                              (size_t)apdu::MAX_SHORT_DATA);
                 return exitc::bad_args;
             }
             std::string payload;
             int         rc = query("EXCHANGE " + args[1] + " " + hex::encode(raw), payload);
             if (rc != exitc::ok)
                 return rc;
             return show_apdu_response(payload);
         }},
        {"close",
         [&]() -> int {
             if (!need(2))
                 return exitc::bad_args;
             return send_line("CLOSE " + args[1]);
         }},
        {"disconnect",
         [&]() -> int {
             if (!need(2))
                 return exitc::bad_args;
             return send_line("DISCONNECT " + args[1]);
         }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // parse options (only --sock)
    std::string sock = ipc::expand_user(constants::ctl_sock_path());
    // Allow environment override, then CLI --sock overrides env
    if (const char *e = std::getenv("APDULINK_CTL_SOCK"))
    {
        if (*e)
            sock = ipc::expand_user(e);
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string cmd = to_lower(args[0]);
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };
    auto query  = [&](const std::string &line, std::string &payload) -> int {
        return query_line(sock, line, payload);
    };

    int rc = run_cmd(cmd, args, sender, query);
    return rc;
}
