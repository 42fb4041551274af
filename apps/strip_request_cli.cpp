// SPDX-License-Identifier: Apache-2.0
// Part of the StripRequest (SR) project.
// apps/strip_request_cli.cpp

#include "sr/codec.hpp"
#include "sr/minimizer.hpp"
#include "sr/transport.hpp"
#include "sr/log.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <algorithm>

static void usage(const char* argv0){
    std::cout <<
      "strip-request: strips unnecessary headers, query parameters, cookies and\n"
      "form fields from a captured HTTP request.\n"
      "\n"
      "Usage:\n"
      "  " << argv0 << " -r FILE [-t HOST] [-p PORT] [-u] [-v]\n"
      "\n"
      "Options:\n"
      "  -u, --http               make the request over HTTP (default TLS)\n"
      "  -t, --host HOST          host to make the request to (default 127.0.0.1)\n"
      "  -p, --port PORT          port number to connect to (default 443)\n"
      "  -r, --req FILE           file containing an HTTP request\n"
      "  -v                       verbose mode; log lines go to stderr\n"
      "  -h, --help               show this help\n"
      "\n"
      "Transport:\n"
      "  --connect_timeout <ms>   TCP connect / TLS handshake timeout (default 5000)\n"
      "  --read_timeout <ms>      response header read timeout (default 5000)\n"
      "  --sni NAME               TLS servername override (default: host)\n"
      "  --log FILE               log file (default strip_request.log, \"\" disables)\n";
}

static void print_section(const std::string& title, const std::string& body) {
    std::cout << title << "\n-----------------\n" << body;
    if (body.empty() || body.back() != '\n') std::cout << '\n';
    std::cout << "-----------------\n";
}

static std::string render_fingerprint(const sr::ResponseFingerprint& fp) {
    std::ostringstream oss;
    oss << "status: " << fp.status_code;
    if (!fp.status_message.empty()) oss << ' ' << fp.status_message;
    oss << "\ncontent-length: " << fp.content_length << "\n";
    for (const auto& kv : fp.headers) {
        oss << "  " << kv.first << ": " << kv.second << "\n";
    }
    return oss.str();
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss;
    oss << ifs.rdbuf();
    out = oss.str();
    return true;
}

int main(int argc, char** argv){
    sr::TransportConfig cfg;
    sr::Target target;
    target.host = "127.0.0.1";
    target.port = 443;
    target.tls  = true;

    std::string req_file;
    std::string log_file = "strip_request.log";
    int verbosity = 0;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="-h" || a=="--help") { usage(argv[0]); return 0; }
            else if(a=="-u" || a=="--http") target.tls = false;
            else if((a=="-t" || a=="--host") && i+1<argc) target.host = argv[++i];
            else if((a=="-p" || a=="--port") && i+1<argc) {
                const int port = std::stoi(argv[++i]);
                if (port <= 0 || port >= 0x10000) {
                    std::cerr << "Port number must be between 0 and 65536\n";
                    return 1;
                }
                target.port = (uint16_t)port;
            }
            else if((a=="-r" || a=="--req") && i+1<argc) req_file = argv[++i];
            else if(a.size() > 1 && a[0]=='-' && a.find_first_not_of('v', 1)==std::string::npos) {
                verbosity += (int)a.size() - 1;   // -v, -vv, -vvv
            }
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_ms = std::max(1, std::stoi(argv[++i]));
            else if(a=="--read_timeout" && i+1<argc)    cfg.read_timeout_ms    = std::max(1, std::stoi(argv[++i]));
            else if(a=="--sni" && i+1<argc) cfg.tls_sni = argv[++i];
            else if(a=="--log" && i+1<argc) log_file = argv[++i];
            else {
                std::cerr << "Unknown or incomplete option: " << a << "\n\n";
                usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Numeric option expected a number\n\n";
        usage(argv[0]);
        return 1;
    }

    sr::set_log_verbosity(verbosity);
    sr::set_log_file(log_file);

    std::string raw;
    if (req_file.empty() || !read_file(req_file, raw) || raw.empty()) {
        std::cerr << "Need to specify a readable, non-empty request file (-r FILE).\n\n";
        usage(argv[0]);
        return 1;
    }

    sr::SocketTransport transport(cfg);

    const sr::ProbeOutcome base = sr::probe_baseline(transport, target, raw);
    if (!base.ok) {
        std::cerr << "Error: " << base.error << "\n";
        return 1;
    }

    print_section("Original request:", raw);
    print_section("Base response:", render_fingerprint(base.fingerprint));
    std::cout << "\n";

    const sr::Request parsed   = sr::parse_request(raw);
    const sr::Request stripped = sr::minimize(transport, parsed, base.fingerprint, target);
    const std::string sreq     = sr::serialize_request(stripped);

    print_section("Stripped request:", sreq);

    const sr::ProbeOutcome check = sr::probe_baseline(transport, target, sreq);
    print_section("Stripped response:",
                  check.ok ? render_fingerprint(check.fingerprint) : "error: " + check.error + "\n");
    return 0;
}
