#include <cxxopts.hpp>

#include "CommandInterpreter.hpp"
#include "LogHandler.hpp"
#include "PtyTerminal.hpp"
#include "TabManager.hpp"
#include "TileTermConfig.hpp"

using namespace tt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);

  cxxopts::Options options("tileterm",
                           "Tabs of split terminal panes, driven headless");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("script", "Read commands from this file instead of stdin",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ;
    TileTermConfig::addOptions(&options);

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tileterm version " << TT_VERSION << endl;
      exit(0);
    }

    TileTermConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      if (!config.loadFile(cfgfilename)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    } else if (fs::exists(TileTermConfig::defaultConfigPath()) &&
               !config.loadFile(TileTermConfig::defaultConfigPath())) {
      CLOG(INFO, "stdout") << "Ignoring unreadable config file "
                           << TileTermConfig::defaultConfigPath() << endl;
    }
    config.applyOverrides(result);

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, config.logDir, "tileterm", config.logSize,
        result.count("logtostdout") > 0);
    LogHandler::applyVerbosity(&defaultConf, config.verbose, config.silent);
    el::Helpers::setThreadName("tileterm-main");
    LOG(INFO) << "tileterm " << TT_VERSION << " logging to " << logFile;

    shared_ptr<SessionEventQueue> events(new SessionEventQueue());
    shared_ptr<PseudoTerminalFactory> factory(new PtyTerminalFactory(config));
    shared_ptr<TabManager> manager(new TabManager(config, factory, events));
    CommandInterpreter interpreter(manager, events, config);

    std::ifstream scriptFile;
    string scriptName = result["script"].as<string>();
    if (!scriptName.empty()) {
      scriptFile.open(scriptName);
      if (!scriptFile.is_open()) {
        STFATAL << "Could not open script: " << scriptName;
      }
    }
    std::istream &in = scriptName.empty() ? std::cin : scriptFile;

    string line;
    bool exitRequested = false;
    while (!exitRequested && std::getline(in, line)) {
      vector<string> output;
      exitRequested = interpreter.execute(line, &output);
      for (const string &reply : output) {
        CLOG(INFO, "stdout") << reply << endl;
      }
    }
    LOG(INFO) << "Shutting down " << manager->count() << " tabs";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  LogHandler::shutdown();
  return 0;
}
