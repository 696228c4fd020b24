#include "shpure/App.hpp"

int main(int argc, char* argv[]) {
  shpure::cli::App app;
  return app.run(argc, argv);
}
