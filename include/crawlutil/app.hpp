#pragma once
#include "config.hpp"
#include <utility>

namespace crawlutil {

class App {
public:
  App() : cfg_(Config::from_env()) {}
  explicit App(Config cfg) : cfg_(std::move(cfg)) {}

  int run(int argc, char **argv);

private:
  Config cfg_;
};

} // namespace crawlutil
