#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "editor_options.hpp"
#include <exception>
#include <filesystem>
#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "no file specified" << std::endl;
    return 1;
  }
  std::filesystem::path path(argv[1]);
  EditorOptions opts;
  std::string rc_msg;
  bool rc_ok = true;
  if (auto rc = default_rc_path()) rc_ok = load_rc(*rc, opts, rc_msg);
  try {
    Terminal term;
    NcursesTerminal nc;
    Editor ed(nc, path, opts);
    if (!rc_ok) ed.set_message(rc_msg);
    return ed.run();
  } catch (const std::exception& e) {
    std::cerr << "tinyed: " << e.what() << std::endl;
    return 1;
  }
}
