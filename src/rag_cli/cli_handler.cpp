#include "rag_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>
#include <memory>

#include "rag_core/config.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/corpus_export.hpp"
#include "rag_core/services/indexing_pipeline.hpp"
#include "rag_core/services/service_provider.hpp"

namespace rag_cli {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
    }
    return argv[++i];
}

int parse_int(const std::string& value, const std::string& flag) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

float parse_float(const std::string& value, const std::string& flag) {
    try {
        return std::stof(value);
    } catch (const std::exception&) {
        throw CliError("Invalid number for " + flag + ": " + value);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "index" || command == "i") {
        options.command = Command::Index;
    } else if (command == "export" || command == "e") {
        options.command = Command::Export;
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
    } else if (command == "status" || command == "st") {
        options.command = Command::Status;
    } else if (command == "runs" || command == "r") {
        options.command = Command::Runs;
    } else if (command == "reload") {
        options.command = Command::Reload;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--config" || flag == "-c") {
            options.config_path = require_value(argc, argv, i, flag);
        } else if (flag == "--source" || flag == "-s") {
            options.source_dir = require_value(argc, argv, i, flag);
        } else if (flag == "--out" || flag == "-o") {
            options.output_dir = require_value(argc, argv, i, flag);
        } else if (flag == "--query" || flag == "-q") {
            options.query = require_value(argc, argv, i, flag);
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_int(require_value(argc, argv, i, flag), flag);
        } else if (flag == "--threshold" || flag == "-t") {
            options.score_threshold = parse_float(require_value(argc, argv, i, flag), flag);
            options.has_threshold = true;
        } else if (flag == "--limit" || flag == "-n") {
            options.limit = parse_int(require_value(argc, argv, i, flag), flag);
        } else if (flag == "--dedupe") {
            options.dedupe_by_document = true;
        } else if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
        } else {
            throw CliError("Unknown option for " + command + ": " + flag);
        }
    }

    if (options.command == Command::Query && options.query.empty()) {
        throw CliError("Query command requires a query. Usage: query --query <text>");
    }
    if (options.command == Command::Export && options.output_dir.empty()) {
        throw CliError("Export command requires an output directory. Usage: export --out <dir>");
    }
    if (options.top_k < 0) {
        throw CliError("--top-k must be greater than 0");
    }
    if (options.limit <= 0) {
        throw CliError("--limit must be greater than 0");
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Index:
            return handle_index_command(options);
        case Command::Export:
            return handle_export_command(options);
        case Command::Query:
            return handle_query_command(options);
        case Command::Status:
            return handle_status_command(options);
        case Command::Runs:
            return handle_runs_command(options);
        case Command::Reload:
            return handle_reload_command(options);
        case Command::Help:
            return handle_help_command(options);
    }
    return 1;
}

int CliHandler::handle_index_command(const CliOptions& options) {
    rag_core::Config config = rag_core::Config::from_file(options.config_path);
    const std::string source_dir = options.source_dir.empty() ? config.source_docs_dir : options.source_dir;
    std::cout << "Indexing documents in: " << source_dir << std::endl;

    std::unique_ptr<rag_core::ServiceProvider> services = rag_core::ServiceProvider::from_config(config);
    try {
        rag_core::RunSummary summary = services->get_indexing_pipeline().run(source_dir);
        print_run_summary(summary.to_json());
        return summary.published ? 0 : 1;
    } catch (const rag_core::IndexPublishError& e) {
        print_error("Indexing run not started: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_export_command(const CliOptions& options) {
    rag_core::Config config = rag_core::Config::from_file(options.config_path);
    std::shared_ptr<rag_core::CorpusRepository> repository = rag_core::make_corpus_repository(config.storage);
    try {
        auto files = rag_core::export_active_corpus(*repository, options.output_dir);
        for (const auto& file : files) {
            std::cout << "  " << file.string() << std::endl;
        }
        return 0;
    } catch (const rag_core::CorpusDataError& e) {
        print_error("Failed to export corpus: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_query_command(const CliOptions& options) {
    std::cout << "Retrieve for: " << options.query << std::endl;

    nlohmann::json request_data = {{"query", options.query}};
    if (options.top_k > 0) {
        request_data["top_k"] = options.top_k;
    }
    if (options.has_threshold) {
        request_data["score_threshold"] = options.score_threshold;
    }
    if (options.dedupe_by_document) {
        request_data["dedupe_by_document"] = true;
    }

    try {
        nlohmann::json response = make_post_request("/api/retrieve", request_data);
        print_retrieve_response(response, options.verbose);
        return 0;
    } catch (const CliError& e) {
        print_error("Failed to retrieve: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_status_command(const CliOptions&) {
    try {
        print_json_response(make_get_request("/api/corpus"));
        return 0;
    } catch (const CliError& e) {
        print_error("Failed to get corpus status: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_runs_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/api/runs?limit=" + std::to_string(options.limit));
        const nlohmann::json runs = response.value("data", nlohmann::json::object())
                                        .value("runs", nlohmann::json::array());
        if (runs.empty()) {
            std::cout << "No indexing runs recorded." << std::endl;
        }
        for (const auto& run : runs) {
            std::cout << "  " << run.value("finished_at", "") << "  " << std::setw(9) << std::left
                      << run.value("status", "") << "  " << run.value("version", "-") << "  ("
                      << run.value("run_id", "") << ")" << std::endl;
        }
        return 0;
    } catch (const CliError& e) {
        print_error("Failed to list runs: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_reload_command(const CliOptions&) {
    try {
        print_json_response(make_post_request("/api/corpus/reload", nlohmann::json::object()));
        return 0;
    } catch (const CliError& e) {
        print_error("Failed to reload corpus: " + std::string(e.what()));
        return 1;
    }
}

int CliHandler::handle_help_command(const CliOptions&) {
    print_help();
    return 0;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform_request(endpoint);
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (!body.is_discarded() && body.is_object() && body.contains("error")) {
            message += " (" + body["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned a malformed JSON response");
    }
    return body;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    std::string base = api_base_url_;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }
    return base + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_retrieve_response(const nlohmann::json& response, bool verbose) {
    std::cout << "\n=== Retrieval Results (corpus " << response.value("corpus_version", "")
              << ") ===" << std::endl;

    const nlohmann::json results = response.value("results", nlohmann::json::array());
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
    }
    int rank = 1;
    for (const auto& chunk : results) {
        std::string text = chunk.value("text", "");
        std::cout << "  [" << rank++ << "] " << chunk.value("document_name", "") << " #"
                  << chunk.value("index_in_document", 0) << " | Score: " << std::fixed
                  << std::setprecision(3) << chunk.value("score", 0.0f) << std::endl;
        if (verbose) {
            std::cout << text << std::endl << std::endl;
        } else {
            std::cout << "    " << text.substr(0, 100) << (text.size() > 100 ? "..." : "") << std::endl;
        }
    }

    for (const auto& warning : response.value("warnings", nlohmann::json::array())) {
        std::cerr << "Warning: " << warning.value("message", "") << " ("
                  << warning.value("chunk_id", "") << ")" << std::endl;
    }
}

void CliHandler::print_run_summary(const nlohmann::json& summary) {
    std::cout << "\n=== Indexing Run " << summary.value("run_id", "") << " ===" << std::endl;
    std::cout << "Status:     " << summary.value("status", "") << std::endl;
    std::cout << "Version:    " << summary.value("version", "-") << std::endl;
    std::cout << "Documents:  " << summary.value("documents_succeeded", 0) << " indexed, "
              << summary.value("documents_reused", 0) << " reused, "
              << summary.value("documents_skipped", 0) << " skipped, "
              << summary.value("documents_failed", 0) << " failed" << std::endl;
    std::cout << "Chunks:     " << summary.value("chunks_embedded", 0) << " embedded, "
              << summary.value("chunks_failed", 0) << " failed" << std::endl;
    const std::string publish_error = summary.value("publish_error", "");
    if (!publish_error.empty()) {
        std::cout << "Publish:    " << publish_error << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
RAG CLI - Retrieval index builder and query client

Usage: rag_cli <command> [options]

Indexing Commands (run locally):
  index, i      Chunk, embed and publish every document in the source directory
    --config, -c <path>    Config file (default: ragrc.json)
    --source, -s <dir>     Source directory (default: source_docs_dir from config)

  export, e     Write the active payload shards and chunk-detail map to a directory
    --config, -c <path>    Config file (default: ragrc.json)
    --out, -o <dir>        Output directory

Query Commands (talk to rag_api):
  query, q      Retrieve the passages most relevant to a query
    --query, -q <text>     Query text
    --top-k, -k <num>      Number of passages (default: server setting)
    --threshold, -t <num>  Minimum similarity score
    --dedupe               At most one passage per source document
    --verbose, -v          Print full passage text

  status, st    Show the active corpus version
  runs, r       Show recent indexing runs
    --limit, -n <num>      Number of runs (default: 10)
  reload        Make rag_api load the newest published version

  help, h       Show this help message

Environment:
  API_BASE_URL  Base URL of rag_api (default: http://127.0.0.1:3040)
)" << std::endl;
}

}  // namespace rag_cli
