#include "rag_cli/cli_handler.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <sstream>

namespace rag_cli {

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

    if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            } else if (flag == "--name" || flag == "-n") {
                options.document_name = value;
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Upload command requires a file path. Usage: upload --file <path>");
        }
        if (options.document_name.empty()) {
            options.document_name = std::filesystem::path(options.file_path).filename().string();
        }
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                try {
                    options.top_k = std::stoi(value);
                } catch (const std::exception&) {
                    throw CliError("--top-k expects a number, got " + value);
                }
            }
        }
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
        if (options.top_k <= 0) {
            throw CliError("--top-k must be greater than 0");
        }
    } else if (command == "reset" || command == "r") {
        options.command = Command::Reset;
    } else if (command == "status" || command == "st") {
        options.command = Command::Status;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    try {
        switch (options.command) {
            case Command::Upload:
                handle_upload_command(options);
                break;
            case Command::Search:
                handle_search_command(options);
                break;
            case Command::Reset:
                handle_reset_command(options);
                break;
            case Command::Status:
                handle_status_command(options);
                break;
            case Command::Help:
                print_help();
                break;
        }
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    return 0;
}

std::string CliHandler::read_text_file(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw CliError("Could not open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    std::cout << "Uploading file: " << options.file_path << " as '" << options.document_name << "'"
              << std::endl;

    nlohmann::json request_data = {
        {"document_name", options.document_name},
        {"text", read_text_file(options.file_path)}
    };

    nlohmann::json response = make_post_request("/api/v1/upload", request_data);
    std::cout << response.value("message", "") << std::endl;
    std::cout << "Chunks added: " << response.value("chunks_added", 0)
              << ", total vectors in store: " << response.value("total_vectors_in_store", 0)
              << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"top_k", options.top_k}
    };

    nlohmann::json response = make_post_request("/api/v1/search", request_data);
    print_search_response(response);
}

void CliHandler::handle_reset_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/api/v1/reset-vector-store", nlohmann::json::object());
    std::cout << response.value("message", "") << " Total vectors: "
              << response.value("total_vectors_in_store", 0) << std::endl;
}

void CliHandler::handle_status_command(const CliOptions& options) {
    nlohmann::json health = make_get_request("/api/v1/health");
    nlohmann::json stats = make_get_request("/api/v1/stats");
    std::cout << "Server: " << health.value("status", "unknown")
              << " (version " << health.value("version", "?") << ")" << std::endl;
    std::cout << "Total vectors: " << stats.value("total_vectors", 0) << std::endl;
    std::cout << "Embedding dimension: " << stats.value("embedding_dimension", 0) << std::endl;
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
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform_request(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

// Sends whatever request is configured on the handle and decodes the JSON reply
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

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
    if (http_code != 200) {
        std::string detail = body.is_object() ? body.value("error", "") : "";
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                       (detail.empty() ? "" : " (" + detail + ")"));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned a response that is not valid JSON");
    }
    return body;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    std::cout << "\n=== Search Results ===" << std::endl;

    if (!response.contains("sources") || !response["sources"].is_array() || response["sources"].empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    for (const auto& source : response["sources"]) {
        std::string text = source.value("text_preview", "");
        std::cout << "  * " << source.value("document_name", "Unknown") << ":" << source.value("chunk_id", 0)
                  << " | Score: " << std::fixed << std::setprecision(3) << source.value("score", 0.0f) << std::endl;
        std::cout << "    Content: " << text.substr(0, 100);
        if (text.length() > 100) {
            std::cout << "...";
        }
        std::cout << std::endl << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
doc_rag CLI - document retrieval client

Usage: doc_rag_cli <command> [options]

Commands:
  upload, u     Upload a plain text document for indexing
    --file, -f <path>    Path to the file to upload
    --name, -n <name>    Document name (default: the file name)

  search, s     Semantic search over all uploaded chunks
    --query, -q <query>  Search query
    --top-k, -k <num>    Number of results to return (default: 5)

  reset, r      Clear every document from the vector store

  status, st    Show server health and vector count

  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the API (default: http://127.0.0.1:8000)

Examples:
  doc_rag_cli upload --file notes/weather.md
  doc_rag_cli search --query "What is the color of the sky?" --top-k 3
  doc_rag_cli reset
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace rag_cli
