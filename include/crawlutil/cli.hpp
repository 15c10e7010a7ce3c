#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace crawlutil {

struct CmdNormalize {
  std::vector<std::string> paths;
};
struct CmdTrim {
  std::string parent;
  std::vector<std::string> paths;
};
struct CmdDate {
  std::string text;
  std::vector<std::string> formats;
  bool json = false;
};
struct CmdSpawn {
  std::string command;
  std::vector<std::string> args;
  std::optional<int> timeout_ms;
  std::string cwd;
};
struct CmdExec {
  std::string command;
  std::vector<std::string> args;
  std::optional<int> timeout_ms;
  std::string cwd;
  std::optional<std::size_t> max_buffer;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdNormalize, CmdTrim, CmdDate, CmdSpawn, CmdExec,
                             CmdHelp, CmdVersion>;

struct GlobalOpts {
  bool verbose = false;
  std::optional<std::string> log_file;
};

struct ParseResult {
  std::optional<Command> cmd;
  GlobalOpts global;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace crawlutil
