#include <cxxopts.hpp>

#include "ConsoleEvents.hpp"
#include "LinkClient.hpp"
#include "LinkServer.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "SimpleIni.h"
#ifdef WITH_BLUEZ
#include "RfcommSocketHandler.hpp"
#endif

using namespace btlink;

namespace {
const std::chrono::hours TRANSFER_WAIT(24);
const std::chrono::seconds REPLY_WAIT(30);
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, InterruptSignalHandler);

  cxxopts::Options options("btlink",
                           "Messages and files over Bluetooth RFCOMM links");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("server", "Run the server until interrupted")  //
        ("scan", "Scan for nearby devices")             //
        ("scan-timeout", "Scan duration in milliseconds",
         cxxopts::value<int64_t>())  //
        ("connect", "Device address (or pipe path) to connect to",
         cxxopts::value<std::string>())  //
        ("send", "Text message to send after connecting",
         cxxopts::value<std::string>())  //
        ("sendfile", "Local file to send after connecting",
         cxxopts::value<std::string>())  //
        ("requestfile", "File to request from the server's share directory",
         cxxopts::value<std::string>())  //
        ("saveto", "Where to save a requested file",
         cxxopts::value<std::string>())                   //
        ("deviceinfo", "Ask the peer for its device info")  //
        ("stats", "Print statistics before exiting")        //
        ("transport", "rfcomm or pipe",
         cxxopts::value<std::string>()->default_value("rfcomm"))  //
        ("pipe", "Socket path the server listens on with --transport=pipe",
         cxxopts::value<std::string>())  //
        ("channel", "RFCOMM channel", cxxopts::value<int>())  //
        ("sharedir", "Directory served to file requests",
         cxxopts::value<std::string>())  //
        ("downloaddir", "Directory for received files",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "btlink version " << BTLINK_VERSION << endl;
      exit(0);
    }

    LinkConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config = LinkConfig::loadFromFile(cfgfilename);
      } catch (const std::runtime_error& re) {
        STFATAL << re.what();
      }
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (result.count("channel")) {
      config.channel = result["channel"].as<int>();
    }
    if (result.count("sharedir")) {
      config.shareDir = result["sharedir"].as<string>();
    }
    if (result.count("downloaddir")) {
      config.downloadDir = result["downloaddir"].as<string>();
    }
    string transport = result["transport"].as<string>();
    if (result.count("pipe")) {
      config.bindAddress = result["pipe"].as<string>();
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "btlink",
                              bool(result.count("logtostdout")),
                              !result.count("logtostdout"),
                              config.maxLogSize);
    LogHandler::applyConfiguration(defaultConf, "btlink-main");

    shared_ptr<SocketHandler> socketHandler;
    CapabilityCheck capabilityCheck;
    if (transport == "pipe") {
      socketHandler.reset(new PipeSocketHandler(config.connectTimeoutMs));
#ifdef WITH_BLUEZ
    } else if (transport == "rfcomm") {
      socketHandler.reset(new RfcommSocketHandler(config.connectTimeoutMs));
      capabilityCheck = RfcommSocketHandler::adapterAvailable;
#endif
    } else {
      CLOG(INFO, "stdout") << "Unsupported transport: " << transport << endl;
      exit(1);
    }

    auto context = LinkContext::create(config, socketHandler, capabilityCheck);
    auto events = make_shared<ConsoleEvents>();
    bool ok = true;

    if (result.count("server")) {
      LinkServer server(context);
      Subscription subscription = server.subscribe(events);
      if (!server.start()) {
        exit(1);
      }
      CLOG(INFO, "stdout") << "Listening on " << server.getEndpoint()
                           << ", press ctrl+c to exit" << endl;
      // InterruptSignalHandler ends the process
      while (server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::seconds(60));
        server.statistics().logStatistics();
      }
      return 0;
    }

    shared_ptr<DiscoverySource> discovery;
#ifdef WITH_BLUEZ
    discovery.reset(new HciDiscoverySource(context->threadPool));
#endif
    if (!discovery && result.count("scan")) {
      CLOG(INFO, "stdout") << "Scanning needs BlueZ support" << endl;
      exit(1);
    }
    LinkClient client(context, discovery);
    Subscription subscription = client.subscribe(events);

    if (result.count("scan")) {
      int64_t timeoutMs = result.count("scan-timeout")
                              ? result["scan-timeout"].as<int64_t>()
                              : config.scanTimeoutMs;
      if (!client.startScan(timeoutMs)) {
        ok = false;
      } else {
        events->waitFor("scan", std::chrono::milliseconds(timeoutMs) +
                                    std::chrono::seconds(15));
      }
    }

    if (result.count("connect")) {
      string address = result["connect"].as<string>();
      if (!client.connect(address)) {
        exit(1);
      }
      if (result.count("deviceinfo")) {
        ok = client.requestDeviceInfo(address) &&
             events->waitFor("deviceinfo", REPLY_WAIT) && ok;
      }
      if (result.count("send")) {
        ok = client.sendText(address, result["send"].as<string>()) && ok;
      }
      if (result.count("sendfile")) {
        string transferId =
            client.sendFile(address, result["sendfile"].as<string>());
        ok = events->waitForTransfer(transferId, TRANSFER_WAIT) && ok;
      }
      if (result.count("requestfile")) {
        string fileName = result["requestfile"].as<string>();
        string savePath =
            result.count("saveto")
                ? result["saveto"].as<string>()
                : (fs::path(config.downloadDir) /
                   fs::path(fileName).filename())
                      .string();
        string transferId = client.requestFile(address, fileName, savePath);
        ok = events->waitForTransfer(transferId, TRANSFER_WAIT) && ok;
      }
      if (!result.count("deviceinfo") && !result.count("send") &&
          !result.count("sendfile") && !result.count("requestfile")) {
        // Interactive: every line typed becomes a text message
        string line;
        while (std::getline(std::cin, line)) {
          if (!client.sendText(address, line)) {
            ok = false;
            break;
          }
        }
      }
      client.disconnect(address);
    }

    if (result.count("stats")) {
      CLOG(INFO, "stdout") << client.statistics().snapshot().dump(2) << endl;
    }
    context->eventQueue->flush();
    return ok ? 0 : 1;
  } catch (const std::exception& e) {
    CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
