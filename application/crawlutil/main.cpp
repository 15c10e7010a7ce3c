#include <crawlutil/app.hpp>

#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char **argv) {
  try {
    return crawlutil::App{}.run(argc, argv);
  } catch (const std::exception &e) {
    spdlog::critical("fatal: {}", e.what());
    return 1;
  }
}
