#include "editor_options.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

static bool parse_on_off(const std::string& v, bool& out) {
  if (v == "on" || v == "true" || v == "1") { out = true; return true; }
  if (v == "off" || v == "false" || v == "0") { out = false; return true; }
  return false;
}

static void register_option_commands(CommandRegistry& registry, EditorOptions& opts) {
  registry.register_command("set unknownkeys", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set unknownkeys: use insert|ignore"; return false; }
    if (args[0] == "insert") { opts.unknown_keys = UnknownKeyPolicy::InsertCode; return true; }
    if (args[0] == "ignore") { opts.unknown_keys = UnknownKeyPolicy::Ignore; return true; }
    msg = "set unknownkeys: use insert|ignore";
    return false;
  });
  registry.register_command("set atomicsave", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1 || !parse_on_off(args[0], opts.atomic_save)) {
      msg = "set atomicsave: use on|off";
      return false;
    }
    return true;
  });
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / TINYED_RC_NAME;
}

bool execute_rc_command(const std::string& line, EditorOptions& opts, std::string& msg) {
  std::string s = trim(line);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    // "set name=value" and "set name value" are equivalent
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    subargs.insert(subargs.end(), args.begin() + 1, args.end());
    cmd = "set " + name;
    args = std::move(subargs);
  }
  CommandRegistry registry;
  register_option_commands(registry, opts);
  return registry.execute(cmd, args, msg) == CommandRegistry::Result::Ok;
}

bool load_rc(const std::filesystem::path& path, EditorOptions& opts, std::string& msg) {
  std::vector<std::string> lines;
  std::string read_msg;
  ReadStatus st = read_lines(path, lines, read_msg);
  if (st == ReadStatus::NotFound) return true;
  if (st != ReadStatus::Ok) { msg = read_msg; return false; }
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!execute_rc_command(lines[i], opts, m)) {
      if (ok) msg = path.filename().string() + ":" + std::to_string(i + 1) + ": " + m;
      ok = false;
    }
  }
  return ok;
}
