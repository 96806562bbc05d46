#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace rag_cli
{

  enum class Command
  {
    Upload,
    Search,
    Reset,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string document_name;
    std::string query;
    int top_k = 5;
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
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command, returns the process exit code
    int execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    // Reads a document as plain text, the way it will be uploaded
    static std::string read_text_file(const std::string &file_path);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_upload_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_reset_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_search_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
