#include "editor_options.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static void test_set_commands() {
  EditorOptions o;
  std::string msg;
  assert(o.unknown_keys == UnknownKeyPolicy::InsertCode);
  assert(o.atomic_save);
  assert(execute_rc_command("set unknownkeys ignore", o, msg));
  assert(o.unknown_keys == UnknownKeyPolicy::Ignore);
  assert(execute_rc_command(":set unknownkeys=insert", o, msg));
  assert(o.unknown_keys == UnknownKeyPolicy::InsertCode);
  assert(execute_rc_command("  set atomicsave off  ", o, msg));
  assert(!o.atomic_save);
}

static void test_comments_and_blanks() {
  EditorOptions o;
  std::string msg;
  assert(execute_rc_command("", o, msg));
  assert(execute_rc_command("# set atomicsave off", o, msg));
  assert(execute_rc_command("\" vim style", o, msg));
  assert(execute_rc_command("// c style", o, msg));
  assert(o.atomic_save);
}

static void test_rejections() {
  EditorOptions o;
  std::string msg;
  assert(!execute_rc_command("set unknownkeys maybe", o, msg));
  assert(msg == "set unknownkeys: use insert|ignore");
  assert(o.unknown_keys == UnknownKeyPolicy::InsertCode);
  assert(!execute_rc_command("set wrap on", o, msg));
  assert(msg == "unknown command: set wrap");
  assert(!execute_rc_command("bogus", o, msg));
}

static void test_load_rc_file() {
  fs::path dir = fs::temp_directory_path() / ("tinyed_rc_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  fs::path rc = dir / "tinyedrc";
  EditorOptions o;
  std::string msg;
  assert(load_rc(rc, o, msg));
  {
    std::ofstream out(rc);
    out << "# options\n"
        << "set unknownkeys ignore\n"
        << "set atomicsave nope\n"
        << "set atomicsave off\n";
  }
  assert(!load_rc(rc, o, msg));
  assert(msg == "tinyedrc:3: set atomicsave: use on|off");
  assert(o.unknown_keys == UnknownKeyPolicy::Ignore);
  assert(!o.atomic_save);
  std::error_code ec;
  fs::remove_all(dir, ec);
}

int main() {
  test_set_commands();
  test_comments_and_blanks();
  test_rejections();
  test_load_rc_file();
  return 0;
}
