#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc/command-line commands.
 * Design: map name → handler (args vector, msg); `set x=v` and `set x v`
 * both route to the handler registered as "set x".
 */
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }

  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }

  bool execute_line(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd; iss >> cmd;
    std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::string value;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }
      std::vector<std::string> subargs;
      if (!value.empty()) subargs.push_back(value);
      for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
      return execute("set " + name, subargs, msg);
    }
    return execute(cmd, args, msg);
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
