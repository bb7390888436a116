#include <aw/allocation/glide_path.hpp>
#include <aw/report/report.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc > 1) {
    const std::string a = argv[1];
    if (a == "-h" || a == "--help") {
      std::cout << "Usage: glide_path_info [LABEL]\n"
                << "  without LABEL: print the glide-path table\n"
                << "  with LABEL   : print the glide path selected for LABEL (e.g. a file name)\n";
      return 0;
    }
    const auto& g = aw::allocation::select_glide_path(a);
    std::cout << aw::report::describe_glide_path(g) << "\n";
    return 0;
  }

  for (const auto& g : aw::allocation::glide_path_table()) {
    std::cout << aw::report::describe_glide_path(g) << "\n";
  }
  std::cout << aw::report::describe_glide_path(aw::allocation::default_glide_path()) << "\n";
  return 0;
}
