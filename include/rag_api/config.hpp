#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string ollama_url;
  std::string embedding_model;
  // 0 means ask the embedding model at startup
  int embedding_dimension;

  // Chunking and retrieval
  int chunk_size;
  int chunk_overlap;
  int max_context_chunks;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));

    config.embedding_dimension = int_or_default(json_config, "embedding_dimension", 0);
    config.chunk_size = int_or_default(json_config, "chunk_size", 500);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 50);
    config.max_context_chunks = int_or_default(json_config, "max_context_chunks", 5);

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return parse_port(api_base_url);
  }

 private:
  // Port of a host:port address, in 1-65535
  static int parse_port(const std::string& address) {
    auto colon = address.find(':');
    if (colon == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port, got " + address);
    }
    std::string digits = address.substr(colon + 1);
    if (digits.empty() || digits.size() > 5 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
      throw std::runtime_error("api_base_url port must be a number, got '" + digits + "'");
    }
    int port = std::stoi(digits);
    if (port < 1 || port > 65535) {
      throw std::runtime_error("api_base_url port must be between 1 and 65535, got " + digits);
    }
    return port;
  }

  // Integer with default and basic type safety: a wrongly typed value falls back to the default
  static int int_or_default(const nlohmann::json& json_config, const std::string& key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    parse_port(api_base_url);
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension < 0) {
      throw std::runtime_error("embedding_dimension cannot be negative");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0) {
      throw std::runtime_error("chunk_overlap cannot be negative");
    }
    if (max_context_chunks <= 0) {
      throw std::runtime_error("max_context_chunks must be greater than 0");
    }
  }
};
