#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/chunking/token_chunker.hpp"
#include "rag_core/chunking/vocabulary_tokenizer.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/search_service.hpp"
#include "rag_core/services/service_provider.hpp"
#include "rag_core/store/retrieval_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {

std::string resolve_config_path(int argc, char *argv[]) {
  if (argc > 1) {
    return argv[1];
  }
  const char *from_env = std::getenv("DOC_RAG_CONFIG");
  return from_env ? from_env : "doc_rag.json";
}

Config load_config(const std::string &config_path) {
  if (std::filesystem::exists(config_path)) {
    std::cout << "Loading configuration from " << config_path << std::endl;
    return Config::from_file(config_path);
  }
  std::cout << "No config file at " << config_path << ", using defaults" << std::endl;
  return Config::from_json(nlohmann::json::object());
}

std::shared_ptr<rag_core::ServiceProvider> build_services(const Config &config) {
  std::shared_ptr<rag_core::OllamaClient> ollama_client;
  size_t dimension = static_cast<size_t>(config.embedding_dimension);
  try {
    ollama_client = std::make_shared<rag_core::OllamaClient>(config.ollama_url, config.embedding_model);
    if (dimension == 0) {
      dimension = ollama_client->probe_dimension();
    }
  } catch (const rag_core::OllamaError &e) {
    throw rag_core::ConfigurationError("Embedding provider unavailable: " + std::string(e.what()));
  }

  auto chunker = std::make_shared<rag_core::TokenChunker>(
      []() { return std::make_unique<rag_core::VocabularyTokenizer>(); });
  auto store = std::make_shared<rag_core::RetrievalStore>(ollama_client, dimension);

  rag_core::ChunkingOptions chunking;
  chunking.chunk_size = static_cast<size_t>(config.chunk_size);
  chunking.chunk_overlap = static_cast<size_t>(config.chunk_overlap);
  auto ingestion_service = std::make_shared<rag_core::IngestionService>(store, chunker, chunking);
  auto search_service = std::make_shared<rag_core::SearchService>(store, config.max_context_chunks);

  return std::make_shared<rag_core::ServiceProvider>(chunker, ollama_client, store,
                                                     ingestion_service, search_service);
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    Config config = load_config(resolve_config_path(argc, argv));

    std::cout << "Starting document retrieval API server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chunk Size: " << config.chunk_size << ", Overlap: " << config.chunk_overlap
              << std::endl;
    std::cout << "Max Context Chunks: " << config.max_context_chunks << std::endl;

    // --- 1. BUILD SHARED COMPONENTS ---
    std::shared_ptr<rag_core::ServiceProvider> services = build_services(config);

    rag_api::Server server(config.host(), config.port());
    rag_api::Routes routes(services);
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN ---
    std::cout << "Shutdown signal received. Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const rag_core::ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
