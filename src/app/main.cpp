#include <iostream>
#include <cstdlib>

#include "noter/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    noter::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  } catch (...) {
    std::cerr << "Fatal error: Unknown exception" << std::endl;
    return 1;
  }
}
