#include "smartscan_cli/cli_handler.hpp"
#include "smartscan_core/errors.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

std::atomic<bool>* g_cancel_flag = nullptr;

extern "C" void handle_sigint(int) {
  if (g_cancel_flag != nullptr) {
    g_cancel_flag->store(true);
  }
}

}  // namespace

int main(int argc, char *argv[])
{
  smartscan_core::async::CancellationToken cancel;
  g_cancel_flag = cancel.flag();
  std::signal(SIGINT, handle_sigint);

  try
  {
    smartscan_cli::CliOptions options = smartscan_cli::CliHandler::parse_arguments(argc, argv);

    smartscan_cli::CliHandler handler;
    return handler.execute_command(options, cancel);
  }
  catch (const smartscan_core::CancelledError &e)
  {
    std::cerr << "Cancelled: " << e.what() << std::endl;
    return 130;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << smartscan_cli::CliHandler::describe_error(e) << std::endl;
    return 1;
  }
}
