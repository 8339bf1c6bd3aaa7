/**
 * @file main.cpp
 * @brief ventoctl — one-shot commands against a Vento unit, no broker involved.
 *
 * Responsibilities:
 *  - Talk to the unit through the same DeviceClient the daemon uses.
 *  - Exactly one command per run: --dump, --get <name>, --set <name> <value>,
 *    --decode <hex>, --list.
 *  - Print grep-friendly `status=... key=value` lines on stdout, errors on stderr.
 *
 * Examples:
 *   ventoctl --vento-host 192.168.1.40 --dump
 *   ventoctl --vento-host 192.168.1.40 --set fan-speed 3
 *   ventoctl --vento-host 192.168.1.40 --set airflow heat-recovery
 *   ventoctl --decode 6d6f62696c650301040208290d0a
 *
 * Exit codes: 0 ok, 2 bad arguments/value, 3 unit unreachable, 1 socket error.
 */
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "ventobridge/codec.hpp"
#include "ventobridge/device_client.hpp"
#include "ventobridge/parameter.hpp"
#include "ventobridge/topic_map.hpp"
#include "ventobridge/transport/transport_linux_udp.hpp"

using namespace ventobridge;

// ---------- small utilities ----------

static bool parse_hex(const std::string& s, std::vector<uint8_t>& out) {
  auto nib = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string clean;
  for (char c : s) if (c != ' ' && c != ':') clean += c;
  if (clean.size() % 2) return false;
  out.clear();
  for (std::size_t i = 0; i < clean.size(); i += 2) {
    const int hi = nib(clean[i]), lo = nib(clean[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

static void print_frame(const ResponseFrame& f, const Parameter* only) {
  for (const auto& r : f.readings) {
    if (only && r.param != only) continue;
    std::cout << r.param->name << "=" << encode_payload(*r.param, r.value);
    if (r.param->type == ValueType::Enumerated) {
      if (const char* l = r.param->label_for(static_cast<uint8_t>(r.value.number)))
        std::cout << " (" << l << ")";
    }
    std::cout << "\n";
  }
}

static int fail(const Error& e, int code) {
  std::cerr << "status=error reason=" << e.describe() << "\n";
  return code;
}

int main(int argc, char** argv) {
  CLI::App app{"ventoctl - one-shot Vento unit commands"};

  // ---- commands ----
  bool dump = false, list = false;
  std::string get_name;
  std::vector<std::string> set_kv;      // --set <name> <value>
  std::string decode_hex;

  // ---- target / io tuning ----
  transport::UdpConfig udp;
  DeviceClientConfig   dcfg;

  app.add_flag("--dump", dump, "Read and print the full status page");
  app.add_flag("--list", list, "List known parameters");
  app.add_option("--get", get_name, "Read one parameter by name");
  app.add_option("--set", set_kv, "Write one parameter: --set <name> <value>")->expected(2);
  app.add_option("--decode", decode_hex, "Decode a captured datagram given as hex");

  app.add_option("--vento-host", udp.host, "Ventilation unit IP or hostname");
  app.add_option("--vento-port", udp.port, "Ventilation unit UDP port")->capture_default_str();
  app.add_option("--timeout", dcfg.timeout_ms, "Reply timeout per attempt (ms)")->capture_default_str();
  app.add_option("--retries", dcfg.attempts, "Sends before giving up")->capture_default_str();

  CLI11_PARSE(app, argc, argv);

  int cmds = 0;
  cmds += dump ? 1 : 0;
  cmds += list ? 1 : 0;
  cmds += (!get_name.empty()) ? 1 : 0;
  cmds += (set_kv.size() == 2) ? 1 : 0;
  cmds += (!decode_hex.empty()) ? 1 : 0;
  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // -------- offline commands --------
  if (list) {
    for (const auto& p : all_parameters()) {
      std::cout << "id=0x" << to_hex(&p.id, 1) << " name=" << p.name
                << " type=" << to_string(p.type) << " width=" << unsigned(p.width)
                << " writable=" << (p.writable() ? 1 : 0) << "\n";
    }
    return 0;
  }

  if (!decode_hex.empty()) {
    std::vector<uint8_t> raw;
    if (!parse_hex(decode_hex, raw)) {
      std::cerr << "status=error reason=bad_hex\n";
      return 2;
    }
    std::cout << decode_pretty(raw.data(), raw.size()) << "\n";
    return 0;
  }

  // -------- resolve parameter / value before touching the network --------
  const Parameter* param = nullptr;
  Value value;
  Error err;

  const std::string& name = !get_name.empty() ? get_name : (set_kv.empty() ? std::string() : set_kv[0]);
  if (!name.empty()) {
    param = find_parameter(name);
    if (!param) {
      std::cerr << "status=error reason=unknown_param:" << name << "\n";
      return 2;
    }
  }
  if (set_kv.size() == 2 && !decode_payload(*param, set_kv[1], value, err)) return fail(err, 2);

  if (udp.host.empty()) {
    std::cerr << "status=error reason=missing:vento-host\n";
    return 2;
  }

  // -------- request/response over UDP --------
  transport::LinuxUdp link(udp);
  if (!link.begin()) {
    std::cerr << "status=error reason=" << link.last_error() << "\n";
    return 1;
  }
  DeviceClient device(link, dcfg);

  ResponseFrame frame;
  if (set_kv.size() == 2) {
    if (!device.set_parameter(*param, value, frame, err))
      return fail(err, err.code == ErrorCode::InvalidValue ? 2 : 3);
  } else if (!device.query(frame, err)) {
    return fail(err, err.code == ErrorCode::IoError ? 1 : 3);
  }

  std::cout << "status=ok\n";
  print_frame(frame, param);
  return 0;
}
