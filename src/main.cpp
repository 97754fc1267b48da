#include <cpptrace/cpptrace.hpp>

#include "cli.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    return sendmer::run_cli(argc, argv);
  } catch(std::exception& e) {
    sendmer::init_logging(0);
    sendmer::Logger logger("sendmer-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return sendmer::kExitFailure;
  }
}
