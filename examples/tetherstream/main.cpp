/**
 * @file main.cpp
 * @brief tetherstream command-line front end.
 *
 * Usage:
 *   tetherstream [options] interfaces
 *   tetherstream [options] tether
 *   tetherstream [options] scan [--first] [SUBNET]
 *   tetherstream [options] serve
 *   tetherstream [options] token [--regenerate]
 *
 * Options:
 *   --config PATH          INI or JSON file (by extension)
 *   --set SECTION.KEY=VAL  override one value, repeatable
 *   --log-level LEVEL      debug | info | warn | error | fatal | off
 */

#include "ts/app_config.hpp"
#include "ts/config.hpp"
#include "ts/controller.hpp"
#include "ts/log.hpp"
#include "ts/net.hpp"
#include "ts/process_engine.hpp"
#include "ts/shutdown.hpp"
#include "ts/status.hpp"
#include "ts/subnet_scanner.hpp"
#include "ts/tethering.hpp"
#include "ts/token.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

struct CliArgs {
  const char* config_path = nullptr;
  std::vector<const char*> overrides;
  const char* log_level = nullptr;
  const char* command = nullptr;
  std::vector<const char*> command_args;
};

void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "Usage: %s [--config PATH] [--set SECTION.KEY=VALUE]... "
               "[--log-level LEVEL] COMMAND\n"
               "Commands:\n"
               "  interfaces            list network interfaces\n"
               "  tether                report Ethernet tethering state\n"
               "  scan [--first] [NET]  find hosts on the tethering subnet\n"
               "  serve                 re-stream the camera until SIGINT\n"
               "  token [--regenerate]  print or replace the stream token\n",
               prog);
}

bool ParseArgs(int argc, char* argv[], CliArgs& out) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (out.command != nullptr) {
      out.command_args.push_back(arg);
      continue;
    }
    if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--set") == 0 ||
        std::strcmp(arg, "--log-level") == 0) {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "%s needs a value\n", arg);
        return false;
      }
      const char* value = argv[++i];
      if (arg[2] == 'c') {
        out.config_path = value;
      } else if (arg[2] == 's') {
        out.overrides.push_back(value);
      } else {
        out.log_level = value;
      }
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      return false;
    } else if (arg[0] == '-') {
      std::fprintf(stderr, "unknown option %s\n", arg);
      return false;
    } else {
      out.command = arg;
    }
  }
  return out.command != nullptr;
}

bool HasFlag(const CliArgs& args, const char* flag) {
  for (const char* a : args.command_args) {
    if (std::strcmp(a, flag) == 0) return true;
  }
  return false;
}

const char* FirstPositional(const CliArgs& args) {
  for (const char* a : args.command_args) {
    if (a[0] != '-') return a;
  }
  return nullptr;
}

/// File, then overrides, then the typed mapping.
bool LoadConfiguration(const CliArgs& args, ts::AppConfig& out) {
#if TS_CONFIG_HAS_FILE_BACKEND
  ts::MultiConfig store;
  if (args.config_path != nullptr) {
    auto loaded = store.LoadFile(args.config_path);
    if (!loaded.has_value()) {
      std::fprintf(stderr, "cannot load %s (error %u)\n", args.config_path,
                   static_cast<unsigned>(loaded.get_error()));
      return false;
    }
  }
#else
  ts::ConfigStore store;
  if (args.config_path != nullptr) {
    std::fprintf(stderr,
                 "config files are not supported by this build; use --set\n");
    return false;
  }
#endif
  for (const char* assignment : args.overrides) {
    auto r = store.ApplyOverride(assignment);
    if (!r.has_value()) {
      std::fprintf(stderr, "bad override '%s'\n", assignment);
      return false;
    }
  }
  auto app = ts::LoadAppConfig(store);
  if (!app.has_value()) {
    std::fprintf(stderr, "invalid configuration\n");
    return false;
  }
  out = app.value();
  if (args.log_level != nullptr &&
      !ts::log::ParseLevel(args.log_level, out.log_level)) {
    std::fprintf(stderr, "unknown log level '%s'\n", args.log_level);
    return false;
  }
  return true;
}

std::unique_ptr<ts::HostProber> MakeProber(const ts::AppConfig& app) {
  if (app.probe_backend == ts::ProbeBackend::kSockpp) {
#ifdef TS_HAS_SOCKPP
    return std::unique_ptr<ts::HostProber>(
        new ts::net::SockppConnectProbe(app.scan));
#else
    TS_LOG_WARN("Main", "built without sockpp, using the POSIX probe");
#endif
  }
  return std::unique_ptr<ts::HostProber>(new ts::ReachabilityProber(app.scan));
}

ts::ControllerOptions MakeControllerOptions(const ts::AppConfig& app) {
  ts::ControllerOptions opts;
  opts.scan = app.scan;
  opts.scan_start = app.scan_start;
  opts.scan_end = app.scan_end;
  opts.supervisor = app.supervisor;
  return opts;
}

// ============================================================================
// Commands
// ============================================================================

int CmdInterfaces(ts::StreamController& controller) {
  auto primary = controller.PrimaryTetheringInterface();
  for (const auto& info : controller.Interfaces()) {
    const bool is_primary =
        primary.has_value() && primary.value().name == info.name;
    std::printf("%c %-16s %-16s %s%s%s\n", is_primary ? '*' : ' ',
                info.name.c_str(),
                info.ipv4.has_value() ? info.ipv4.value().c_str() : "-",
                info.is_up ? "up" : "down",
                info.is_loopback ? " loopback" : "",
                info.supports_multicast ? " multicast" : "");
  }
  return 0;
}

int CmdTether(ts::StreamController& controller) {
  const bool active = controller.IsEthernetTetheringActive();
  std::printf("ethernet tethering: %s\n", active ? "active" : "inactive");
  auto primary = controller.PrimaryTetheringInterface();
  if (!primary.has_value()) {
    std::printf("tethering interface: none\n");
    return active ? 0 : 1;
  }
  auto subnet = ts::SubnetOf(primary.value());
  std::printf("tethering interface: %s (%s)\n", primary.value().name.c_str(),
              subnet.has_value() ? (subnet.value() + ".0/24").c_str()
                                 : "no IPv4");
  return 0;
}

void PrintProgress(uint32_t completed, uint32_t total, void* /*ctx*/) {
  std::fprintf(stderr, "\rscanning %u/%u", completed, total);
  if (completed == total) std::fputc('\n', stderr);
}

int CmdScan(ts::StreamController& controller, const ts::AppConfig& app,
            const CliArgs& args) {
  const char* subnet = FirstPositional(args);
  if (subnet != nullptr) {
    auto hosts = controller.ScanSubnet(subnet, app.scan_start, app.scan_end,
                                       &PrintProgress, nullptr);
    for (const auto& h : hosts) std::printf("%s\n", h.c_str());
    return hosts.empty() ? 1 : 0;
  }

  auto found = HasFlag(args, "--first")
                   ? controller.QuickDiscoverCamera()
                   : controller.DiscoverCamera(&PrintProgress, nullptr);
  if (!found.has_value()) {
    std::fprintf(stderr, "discovery failed: %s\n",
                 ts::ErrorKindName(found.get_error()));
    return 1;
  }
  std::printf("%s\n", found.value().c_str());
  return 0;
}

int CmdToken(const ts::AppConfig& app, const CliArgs& args) {
  auto token = HasFlag(args, "--regenerate")
                   ? ts::RegenerateToken(app.token_file.c_str())
                   : ts::LoadOrCreateToken(app.token_file.c_str());
  if (!token.has_value()) {
    std::fprintf(stderr, "token store %s unusable\n", app.token_file.c_str());
    return 1;
  }
  std::printf("%s\n", token.value().c_str());
  return 0;
}

struct ServeContext {
  ts::ShutdownManager* shutdown;
  ts::StreamController* controller;
};

void PrintStatus(const ts::StatusSnapshot& snap, ts::StatusReason reason,
                 void* ctx) {
  auto* serve = static_cast<ServeContext*>(ctx);
  switch (reason) {
    case ts::StatusReason::kTransition:
      std::printf("[%s]", ts::SessionStateName(snap.state));
      if (snap.published_url.has_value()) {
        std::printf(" %s", snap.published_url.value().c_str());
      }
      if (snap.last_error.has_value()) {
        std::printf(" error=%s (%s)",
                    ts::ErrorKindName(snap.last_error.value().kind),
                    snap.last_error.value().message.c_str());
      }
      std::printf("\n");
      break;
    case ts::StatusReason::kNotificationRefresh:
      std::printf("%s | %s\n", ts::FormatNotificationText(snap).c_str(),
                  ts::FormatBandwidth(snap.bandwidth_bytes_per_sec).c_str());
      break;
    case ts::StatusReason::kTick:
      break;
  }
  std::fflush(stdout);
  if (snap.state == ts::SessionState::kStopped) {
    serve->shutdown->Quit();
  }
}

void StopOnShutdown(int signo, void* ctx) {
  auto* serve = static_cast<ServeContext*>(ctx);
  if (signo != 0) {
    TS_LOG_INFO("Main", "signal %d, stopping", signo);
  }
  (void)serve->controller->StopSession();
}

int CmdServe(ts::StreamController& controller, const ts::AppConfig& app) {
  ts::StreamConfig stream = app.stream;

  auto token = ts::LoadOrCreateToken(app.token_file.c_str());
  if (!token.has_value()) {
    std::fprintf(stderr, "token store %s unusable\n", app.token_file.c_str());
    return 1;
  }
  stream.token = token.value();

  if (stream.mode == ts::IngestMode::kRtspPull && stream.camera_host.empty()) {
    auto camera = controller.DiscoverCamera(&PrintProgress, nullptr);
    if (!camera.has_value()) {
      std::fprintf(stderr, "no camera: %s\n",
                   ts::ErrorKindName(camera.get_error()));
      return 1;
    }
    stream.camera_host = camera.value();
  }

  ts::ShutdownManager shutdown;
  if (!shutdown.IsValid()) {
    std::fprintf(stderr, "shutdown handling unavailable\n");
    return 1;
  }
  ServeContext serve{&shutdown, &controller};
  auto id = controller.Subscribe(&PrintStatus, &serve);
  if (!id.has_value() ||
      !shutdown.Register(&StopOnShutdown, &serve).has_value() ||
      !shutdown.InstallSignalHandlers().has_value()) {
    std::fprintf(stderr, "cannot set up session monitoring\n");
    return 1;
  }

  auto started = controller.StartSession(stream);
  if (!started.has_value()) {
    std::fprintf(stderr, "session did not start: %s\n",
                 ts::SessionErrorName(started.get_error()));
    controller.Unsubscribe(id.value());
    return 1;
  }

  shutdown.WaitForShutdown();
  controller.Unsubscribe(id.value());

  auto last = controller.Status().last_error;
  return (last.has_value() &&
          last.value().kind == ts::ErrorKind::kReconnectExhausted)
             ? 2
             : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 64;
  }

  ts::AppConfig app;
  if (!LoadConfiguration(args, app)) {
    return 78;
  }
  ts::log::Init();
  ts::log::SetLevel(app.log_level);

  std::unique_ptr<ts::HostProber> prober = MakeProber(app);
  ts::SysfsTetherStateSource tether;
  ts::ProcessMediaEngineFactory engines(app.engine);
  ts::StreamController controller(*prober, tether, engines,
                                  MakeControllerOptions(app));

  int rc = 64;
  if (std::strcmp(args.command, "interfaces") == 0) {
    rc = CmdInterfaces(controller);
  } else if (std::strcmp(args.command, "tether") == 0) {
    rc = CmdTether(controller);
  } else if (std::strcmp(args.command, "scan") == 0) {
    rc = CmdScan(controller, app, args);
  } else if (std::strcmp(args.command, "serve") == 0) {
    rc = CmdServe(controller, app);
  } else if (std::strcmp(args.command, "token") == 0) {
    rc = CmdToken(app, args);
  } else {
    std::fprintf(stderr, "unknown command '%s'\n", args.command);
    PrintUsage(argv[0]);
  }

  ts::log::Shutdown();
  return rc;
}
