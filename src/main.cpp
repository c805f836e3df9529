/**
 * @file main.cpp
 * @brief Точка входа GridSnake: конфигурация, журнал, выбор View, сессия
 *
 * Использование:
 * @code
 * gridsnake [--config PATH] [--view cli|desktop]
 * @endcode
 *
 * После завершённой игры печатает итоговый счёт в консоль и ждёт Enter.
 * Выход по 'q'/Esc/закрытию окна завершает программу сразу.
 */

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "gui/cli/cli.h"
#include "snake_game/common/gsnake_config.hpp"
#include "snake_game/common/gsnake_log.hpp"
#include "snake_game/gsnake_session.hpp"
#include "snake_game/gsnake_view.hpp"

#ifdef GSNAKE_WITH_QT
#include <QtWidgets/QApplication>

#include "gui/desktop/qt_view.hpp"
#endif

namespace {

struct Options {
  std::string config_path;
  std::string view;
  bool help = false;
};

void printUsage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config PATH] [--view cli|desktop]\n"
            << "Steer with arrow keys or WASD, quit with q or Esc.\n";
}

Options parseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--view" && i + 1 < argc) {
      options.view = argv[++i];
    } else {
      throw gsnake::ConfigError("unexpected argument '" + arg + "'");
    }
  }
  return options;
}

gsnake::SessionResult play(const gsnake::GameConfig& config, int argc, char** argv) {
  if (config.view == "desktop") {
#ifdef GSNAKE_WITH_QT
    QApplication app(argc, argv);
    gsnake::Session session(config, qt_view, config.window_width,
                            config.window_height);
    return session.run();
#else
    throw gsnake::ConfigError("desktop view is not available in this build");
#endif
  }

  (void)argc;
  (void)argv;
  int width = 0;
  int height = 0;
  cli_surface_for_grid(config.rows, config.cols, &width, &height);
  gsnake::Session session(config, cli_view, width, height);
  return session.run();
}

}  // namespace

int main(int argc, char** argv) {
  gsnake::GameConfig config;
  try {
    const Options options = parseArgs(argc, argv);
    if (options.help) {
      printUsage(argv[0]);
      return EXIT_SUCCESS;
    }
    config = options.config_path.empty() ? gsnake::load_default_config()
                                         : gsnake::load_config(options.config_path);
    if (!options.view.empty()) {
      gsnake::apply_setting(config, "view", options.view);
    }
    gsnake::validate(config);
  } catch (const gsnake::ConfigError& e) {
    std::cerr << "gridsnake: " << e.what() << std::endl;
    printUsage(argv[0]);
    return EXIT_FAILURE;
  }

  gsnake::init_logging(config);

  gsnake::SessionResult result{};
  try {
    result = play(config, argc, argv);
  } catch (const gsnake::InvalidDimensions& e) {
    spdlog::error("{}", e.what());
    std::cerr << "gridsnake: " << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const gsnake::ViewError& e) {
    spdlog::error("{}", e.what());
    std::cerr << "gridsnake: " << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const gsnake::ConfigError& e) {
    spdlog::error("{}", e.what());
    std::cerr << "gridsnake: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  spdlog::shutdown();
  if (result.status == gsnake::SessionStatus::CANCELLED) {
    return EXIT_SUCCESS;
  }

  std::cout << "Your final score is " << result.score << "!" << std::endl;
  std::cout << "Press enter in the console to close the program!" << std::endl;
  std::string line;
  std::getline(std::cin, line);
  return EXIT_SUCCESS;
}
