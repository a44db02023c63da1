#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/config.hpp"
#include "rag_core/services/corpus_loader.hpp"
#include "rag_core/services/service_provider.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_all();
}

namespace {

void refresh_corpus(rag_core::CorpusLoader &loader) {
  try {
    loader.refresh();
  } catch (const rag_core::RagError &e) {
    std::cerr << "[CorpusLoader] Reload failed, keeping current snapshot: " << e.what()
              << std::endl;
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "ragrc.json";
    rag_core::Config config = rag_core::Config::from_file(config_path);

    std::cout << "Starting RAG Retrieval API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Storage: " << rag_core::to_string(config.storage.backend) << " ("
              << config.storage.db_path << ")" << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;

    std::unique_ptr<rag_core::ServiceProvider> services =
        rag_core::ServiceProvider::from_config(config);
    rag_core::CorpusLoader &loader = services->get_corpus_loader();
    refresh_corpus(loader);

    auto [host, port] = rag_api::Server::parse_address(config.api_base_url);
    rag_api::Server server(host, port);
    rag_api::Routes routes(*services);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    // Picks up versions published by rag_cli index
    const std::chrono::seconds reload_interval(config.reload_interval_seconds);
    std::thread reload_thread([&loader, reload_interval] {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      while (!shutdown_cv.wait_for(lock, reload_interval,
                                   [] { return shutdown_requested.load(); })) {
        lock.unlock();
        refresh_corpus(loader);
        lock.lock();
      }
    });

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Stopping corpus reload thread..." << std::endl;
    shutdown_cv.notify_all();
    reload_thread.join();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
