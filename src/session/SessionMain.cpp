#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PhasePrinter.hpp"
#include "RemoteShellLauncher.hpp"
#include "RestSyncEngine.hpp"
#include "SessionConfig.hpp"
#include "SessionController.hpp"
#include "SessionRunner.hpp"
#include "SubprocessUtils.hpp"
#include "TargetResolver.hpp"
#include "TcpSocketHandler.hpp"

using namespace devlink;

namespace {
void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  devlink::HandleTerminate();

  cxxopts::Options options("devlink",
                           "Live remote development sessions");
  string configPath;
  string logDirectory;
  bool logToStdout = false;
  bool silentFlag = false;
  int verboseFlag = -1;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("c,config", "Session config file",
         cxxopts::value<std::string>()->default_value(
             SessionConfig::defaultConfigPath()))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "devlink version " << DEVLINK_VERSION << endl;
      exit(0);
    }

    configPath = result["config"].as<string>();
    logDirectory = result["logdir"].as<string>();
    logToStdout = result.count("logtostdout") > 0;
    silentFlag = result.count("silent") > 0;
    if (result.count("verbose")) {
      verboseFlag = result["verbose"].as<int>();
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  }

  DebugSettings debug;
  SessionManifest manifest;
  try {
    manifest = SessionConfig::load(configPath, &debug);
  } catch (const SessionError& se) {
    CLOG(INFO, "stdout") << se.getKind() << ": " << se.what() << endl;
    return 1;
  }

  LogDestination logDestination;
  logDestination.directory = logDirectory;
  logDestination.toStdout = logToStdout;
  logDestination.silent = silentFlag || debug.silent;
  logDestination.verbose = verboseFlag >= 0 ? verboseFlag : debug.verbose;
  logDestination.maxFileSize = debug.logsize;
  try {
    LogHandler::apply(&defaultConf, logDestination);
  } catch (const SessionError& se) {
    CLOG(INFO, "stdout") << se.getKind() << ": " << se.what() << endl;
    return 1;
  }
  el::Helpers::setThreadName("devlink-main");

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  LOG(INFO) << "Starting session " << manifest.name() << " from "
            << configPath;

  shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
  shared_ptr<TargetResolver> resolver(new StaticTargetResolver());
  SyncEngineFactory syncEngineFactory =
      [subprocessUtils](const SessionManifest& sessionManifest,
                        const TargetIdentity& target) {
        return shared_ptr<SyncEngine>(new RestSyncEngine(
            sessionManifest.sync(), target, subprocessUtils));
      };
  shared_ptr<ShellLauncher> shellLauncher(
      new RemoteShellLauncher(manifest, subprocessUtils));
  shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());

  shared_ptr<SessionController> controller(new SessionController(
      manifest, resolver, syncEngineFactory, shellLauncher, socketHandler));
  controller->setPhaseListener(printPhaseChange);

  SessionRunner runner(controller);
  SessionResult sessionResult = runner.run();

  if (!sessionResult.isClean()) {
    CLOG(INFO, "stdout") << sessionResult.kind << ": " << sessionResult.message
                         << endl;
    printAccessDetails(sessionResult.lastTarget);
    LOG(INFO) << "Session ended with " << sessionResult.kind;
    return 1;
  }

  LOG(INFO) << "Session ended cleanly";
  return 0;
}
