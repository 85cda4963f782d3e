#include "smartscan_cli/cli_handler.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip> // Required for std::fixed and std::setprecision

#include "smartscan_core/chunking/text_chunker.hpp"
#include "smartscan_core/errors.hpp"
#include "smartscan_core/extractors/content_extractor_factory.hpp"
#include "smartscan_core/llm/http_transport.hpp"
#include "smartscan_core/llm/ollama_client.hpp"
#include "smartscan_core/services/document_indexer.hpp"
#include "smartscan_core/services/query_service.hpp"
#include "smartscan_core/vector_store.hpp"

namespace smartscan_cli {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
    }
}

Command parse_command(const std::string& command) {
    if (command == "status" || command == "ping") {
        return Command::Status;
    } else if (command == "index" || command == "i") {
        return Command::Index;
    } else if (command == "search" || command == "s") {
        return Command::Search;
    } else if (command == "ask" || command == "a") {
        return Command::Ask;
    } else if (command == "chat" || command == "c") {
        return Command::Chat;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        return Command::Help;
    }
    throw CliError("Unknown command: " + command);
}

}  // namespace

CliHandler::CliHandler(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    options.command = parse_command(argv[1]);

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw CliError("Flag " + flag + " requires a value");
        }
        std::string value = argv[++i];

        if (flag == "--config") {
            options.config_path = value;
        } else if (flag == "--folder" || flag == "-f") {
            options.folder = value;
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_int(flag, value);
        } else if (flag == "--url") {
            options.ollama_url = value;
        } else if (flag == "--embedding-model") {
            options.embedding_model = value;
        } else if (flag == "--llm-model") {
            options.llm_model = value;
        } else if (flag == "--workers") {
            options.num_workers = parse_int(flag, value);
        } else {
            throw CliError("Unknown flag: " + flag);
        }
    }

    if ((options.command == Command::Search || options.command == Command::Ask) &&
        smartscan_core::is_blank(options.query)) {
        throw CliError("This command requires a query. Usage: " +
                       std::string(options.command == Command::Ask ? "ask" : "search") +
                       " --folder <dir> --query <question>");
    }

    return options;
}

Config CliHandler::resolve_config(const CliOptions& options) {
    std::string config_path = options.config_path;
    if (config_path.empty()) {
        const char* env_path = std::getenv("SMARTSCAN_CONFIG");
        if (env_path != nullptr) {
            config_path = env_path;
        }
    }

    Config config = config_path.empty() ? Config::defaults() : Config::from_file(config_path);

    if (!options.folder.empty()) {
        config.documents_folder = options.folder;
    }
    if (!options.ollama_url.empty()) {
        config.ollama_url = options.ollama_url;
    }
    if (!options.embedding_model.empty()) {
        config.embedding_model = options.embedding_model;
    }
    if (!options.llm_model.empty()) {
        config.llm_model = options.llm_model;
    }
    if (options.top_k != 0) {
        config.top_k = options.top_k;
    }
    if (options.num_workers != 0) {
        config.num_workers = options.num_workers;
    }

    config.validate();
    return config;
}

Session CliHandler::build_session(const Config& config,
                                  const smartscan_core::async::CancellationToken& cancel) {
    smartscan_core::OllamaClientOptions client_options;
    client_options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);
    client_options.retry_policy = smartscan_core::RetryPolicy::exponential(
        config.retry_max_attempts, std::chrono::milliseconds(config.retry_initial_backoff_ms));
    client_options.cancel = cancel;

    Session session;
    session.vector_store = std::make_shared<smartscan_core::VectorStore>(
        config.strict_dimensions ? smartscan_core::DimensionPolicy::Reject
                                 : smartscan_core::DimensionPolicy::Tolerate);
    session.ollama_client = std::make_shared<smartscan_core::OllamaClient>(
        config.ollama_url, std::make_shared<smartscan_core::CurlHttpTransport>(), client_options);

    smartscan_core::IndexerOptions indexer_options;
    indexer_options.chunking = {config.chunk_size_words, config.overlap_words};
    indexer_options.num_workers = static_cast<size_t>(config.num_workers);

    session.indexer = std::make_shared<smartscan_core::DocumentIndexer>(
        session.vector_store, session.ollama_client,
        std::make_shared<smartscan_core::ContentExtractorFactory>(), indexer_options);
    session.query_service = std::make_shared<smartscan_core::QueryService>(
        session.vector_store, session.ollama_client, session.ollama_client);
    return session;
}

std::string CliHandler::describe_error(const std::exception& error) {
    if (const auto* smartscan_error = dynamic_cast<const smartscan_core::SmartScanError*>(&error)) {
        return "[" + smartscan_core::to_string(smartscan_error->kind()) + "] " + smartscan_error->what();
    }
    return error.what();
}

int CliHandler::execute_command(const CliOptions& options,
                                const smartscan_core::async::CancellationToken& cancel) {
    if (options.command == Command::Help) {
        print_help();
        return 0;
    }

    Config config = resolve_config(options);
    Session session = build_session(config, cancel);

    switch (options.command) {
        case Command::Status:
            return handle_status_command(config, session);
        case Command::Index:
            return handle_index_command(config, session, options, cancel);
        case Command::Search:
            return handle_search_command(config, session, options, cancel);
        case Command::Ask:
            return handle_ask_command(config, session, options, cancel);
        case Command::Chat:
            return handle_chat_command(config, session, options, cancel);
        case Command::Help:
            break;
    }
    print_help();
    return 0;
}

int CliHandler::index_folder(const Config& config, Session& session, bool verbose,
                             const smartscan_core::async::CancellationToken& cancel) {
    smartscan_core::ProgressCallback progress;
    if (verbose) {
        progress = [this](const std::string& message) { err_ << message << std::endl; };
    }

    int count = session.indexer->index_documents(config.documents_folder, config.embedding_model,
                                                 progress, cancel);
    err_ << "Indexed " << count << " text chunks from documents in '" << config.documents_folder
         << "'." << std::endl;
    if (verbose && count > 0) {
        err_ << "Embedding dimensions: " << session.vector_store->dimensions() << std::endl;
    }
    return count;
}

int CliHandler::handle_status_command(const Config& config, Session& session) {
    if (session.ollama_client->is_server_available()) {
        out_ << "Connected to Ollama at " << config.ollama_url << "." << std::endl;
        return 0;
    }
    out_ << "Cannot reach Ollama at " << config.ollama_url << ". Start it with: ollama serve"
         << std::endl;
    return 1;
}

int CliHandler::handle_index_command(const Config& config, Session& session, const CliOptions& options,
                                     const smartscan_core::async::CancellationToken& cancel) {
    int count = index_folder(config, session, options.verbose, cancel);
    out_ << count << std::endl;
    return 0;
}

int CliHandler::handle_search_command(const Config& config, Session& session, const CliOptions& options,
                                      const smartscan_core::async::CancellationToken& cancel) {
    index_folder(config, session, options.verbose, cancel);

    auto results = session.query_service->retrieve(options.query, config.embedding_model, config.top_k, cancel);
    if (results.empty()) {
        out_ << "No results." << std::endl;
        return 0;
    }

    int rank = 1;
    for (const auto& result : results) {
        out_ << rank++ << ". [" << result.chunk.source << "] score " << std::fixed << std::setprecision(4)
             << result.score << std::endl;
        out_ << "   " << result.chunk.text << std::endl;
    }
    return 0;
}

int CliHandler::handle_ask_command(const Config& config, Session& session, const CliOptions& options,
                                   const smartscan_core::async::CancellationToken& cancel) {
    index_folder(config, session, options.verbose, cancel);
    out_ << session.query_service->answer(options.query, config.llm_model, config.embedding_model,
                                          config.top_k, cancel)
         << std::endl;
    return 0;
}

int CliHandler::handle_chat_command(const Config& config, Session& session, const CliOptions& options,
                                    const smartscan_core::async::CancellationToken& cancel) {
    index_folder(config, session, true, cancel);
    out_ << "Ask a question (:clear, :reindex, :quit)." << std::endl;

    std::string line;
    while (true) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line)) {
            break;
        }
        if (smartscan_core::is_blank(line)) {
            continue;
        }
        if (line == ":quit" || line == ":q") {
            break;
        }
        if (line == ":clear") {
            session.vector_store->clear();
            out_ << "Index cleared." << std::endl;
            continue;
        }
        if (line == ":reindex") {
            index_folder(config, session, options.verbose, cancel);
            continue;
        }

        try {
            out_ << session.query_service->answer(line, config.llm_model, config.embedding_model,
                                                  config.top_k, cancel)
                 << std::endl;
        } catch (const smartscan_core::CancelledError&) {
            throw;
        } catch (const smartscan_core::SmartScanError& e) {
            // A failed question leaves the session usable
            err_ << "Query failed: " << e.what() << std::endl;
        }
    }
    return 0;
}

void CliHandler::print_help() {
    out_ << "SmartScan - ask questions about a folder of documents\n\n"
         << "Usage: smartscan <command> [options]\n\n"
         << "Commands:\n"
         << "  status                              Check that Ollama is reachable\n"
         << "  index  --folder <dir>               Index .txt, .md and .csv files and print the chunk count\n"
         << "  search --folder <dir> --query <q>   Show the most relevant chunks\n"
         << "  ask    --folder <dir> --query <q>   Answer a question from the documents\n"
         << "  chat   --folder <dir>               Index once, then answer questions from stdin\n"
         << "  help                                Show this help\n\n"
         << "Options:\n"
         << "  --config <file>          JSON config (default: $SMARTSCAN_CONFIG)\n"
         << "  --url <url>              Ollama base URL\n"
         << "  --embedding-model <name> Embedding model\n"
         << "  --llm-model <name>       Generation model\n"
         << "  -k, --top-k <n>          Chunks used as context\n"
         << "  --workers <n>            Concurrent embedding requests\n"
         << "  -v, --verbose            Print indexing progress\n";
}

}  // namespace smartscan_cli
