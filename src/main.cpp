#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>

#include "command_line_parser.hpp"
#include "drop_engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

namespace {

// Serves until SIGINT or SIGTERM.
void wait_for_signal(Logger& logger) {
  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([&logger](const std::error_code& ec, int signal_number){
    if(!ec) logger.debug("caught signal {}", signal_number);
  });
  signal_io.run();
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.load();

    CommandLineParser parser("p2pdrop");
    DropEngine::Options options;
    try {
      parser.parse(argc, argv, settings);
      if(settings.help_requested()) {
        parser.usage();
        return 0;
      }
      options = DropEngine::options_from_settings(settings);
    } catch(const UserInputError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }

    init(settings.get<bool>("verbose"));

    DropEngine engine(options);
    auto logger = engine.logger();
    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    engine.start();
    if(options.mode == DropEngine::Mode::Send) {
      wait_for_signal(*logger);
    } else {
      engine.run_receive(readline_source(""));
    }
    engine.stop();

    return 0;
  } catch(const TransportInitError& e) {
    init(false);
    Logger logger("p2pdrop");
    logger.error("Startup failed: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  } catch(const DropError& e) {
    init(false);
    Logger logger("p2pdrop");
    logger.error("{}", e.what());
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("p2pdrop");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
