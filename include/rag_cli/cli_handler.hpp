#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace rag_cli
{

  enum class Command
  {
    Index,
    Export,
    Query,
    Status,
    Runs,
    Reload,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    // Local commands (index, export) read the config directly
    std::string config_path = "ragrc.json";
    std::string source_dir;
    std::string output_dir;
    std::string query;
    // 0 keeps the server default
    int top_k = 0;
    bool has_threshold = false;
    float score_threshold = 0.0f;
    bool dedupe_by_document = false;
    int limit = 10;
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

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; returns the process exit code
    int execute_command(const CliOptions &options);

    // Set API base URL
    void set_api_base_url(const std::string &url);

    // Get API base URL
    std::string get_api_base_url() const;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    int handle_index_command(const CliOptions &options);
    int handle_export_command(const CliOptions &options);
    int handle_query_command(const CliOptions &options);
    int handle_status_command(const CliOptions &options);
    int handle_runs_command(const CliOptions &options);
    int handle_reload_command(const CliOptions &options);
    int handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_retrieve_response(const nlohmann::json &response, bool verbose);
    void print_run_summary(const nlohmann::json &summary);
    void print_error(const std::string &error);
    void print_help();
  };

}
