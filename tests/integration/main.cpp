#define DOCTEST_CONFIG_IMPLEMENT
#include <cstdlib>
#include <doctest/doctest.h>
#include <lats/common.hpp>
#include <llama/llama.h>
#include <string>

// Quiet log callback - suppresses all llama.cpp output
static void quiet_log_callback(enum ggml_log_level level, const char *text,
                               void *user_data) {
  (void)level;
  (void)text;
  (void)user_data;
}

int main(int argc, char **argv) {
  // Suppress llama.cpp and engine logging unless VERBOSE=1 is set
  const char *verbose = std::getenv("VERBOSE");
  if (!verbose || std::string(verbose) != "1") {
    llama_log_set(quiet_log_callback, nullptr);
    lats::log::set_level(lats::log::Level::Off);
  }

  // The shared test model is released by a static destructor, so the
  // backend is initialized once and left up for the process lifetime
  llama_backend_init();

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  return context.run();
}
