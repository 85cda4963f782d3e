#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "smartscan_cli/config.hpp"
#include "smartscan_core/async/cancellation_token.hpp"

namespace smartscan_core
{
  class VectorStore;
  class OllamaClient;
  class DocumentIndexer;
  class QueryService;
}

namespace smartscan_cli
{

  enum class Command
  {
    Status,
    Index,
    Search,
    Ask,
    Chat,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string folder;
    std::string query;
    std::string ollama_url;
    std::string embedding_model;
    std::string llm_model;
    int top_k = 0;        // 0 keeps the configured value
    int num_workers = 0;  // 0 keeps the configured value
    bool verbose = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Everything one CLI invocation needs, built from the resolved Config
  struct Session
  {
    std::shared_ptr<smartscan_core::VectorStore> vector_store;
    std::shared_ptr<smartscan_core::OllamaClient> ollama_client;
    std::shared_ptr<smartscan_core::DocumentIndexer> indexer;
    std::shared_ptr<smartscan_core::QueryService> query_service;
  };

  class CliHandler
  {
  public:
    CliHandler(std::istream &in = std::cin, std::ostream &out = std::cout, std::ostream &err = std::cerr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // File named by --config, else $SMARTSCAN_CONFIG, else defaults; then flag overrides
    static Config resolve_config(const CliOptions &options);

    // One-line report for a failure that ends the process, tagged with its error kind when known
    static std::string describe_error(const std::exception &error);

    // Execute command, returns the process exit code
    int execute_command(const CliOptions &options, const smartscan_core::async::CancellationToken &cancel);

  private:
    std::istream &in_;
    std::ostream &out_;
    std::ostream &err_;

    // Command handlers
    int handle_status_command(const Config &config, Session &session);
    int handle_index_command(const Config &config, Session &session, const CliOptions &options,
                             const smartscan_core::async::CancellationToken &cancel);
    int handle_search_command(const Config &config, Session &session, const CliOptions &options,
                              const smartscan_core::async::CancellationToken &cancel);
    int handle_ask_command(const Config &config, Session &session, const CliOptions &options,
                           const smartscan_core::async::CancellationToken &cancel);
    int handle_chat_command(const Config &config, Session &session, const CliOptions &options,
                            const smartscan_core::async::CancellationToken &cancel);
    void print_help();

    // Helper methods
    static Session build_session(const Config &config, const smartscan_core::async::CancellationToken &cancel);
    int index_folder(const Config &config, Session &session, bool verbose,
                     const smartscan_core::async::CancellationToken &cancel);
  };

}  // namespace smartscan_cli
