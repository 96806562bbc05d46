#include "rag_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "rag_core/chunking/text_utils.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/search_service.hpp"
#include "rag_core/services/service_provider.hpp"
#include "rag_core/store/retrieval_store.hpp"

namespace rag_api {

namespace {
constexpr const char *kApiVersion = "0.1.0";
}  // namespace

Routes::Routes(std::shared_ptr<rag_core::ServiceProvider> services) : services_(services) {
  if (!services_) {
    throw std::invalid_argument("Routes requires a service provider");
  }
}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/api/v1/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/v1/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/api/v1/upload")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_upload(req); });

  CROW_ROUTE(app, "/api/v1/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/api/v1/reset-vector-store")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_reset(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Document retrieval API is running");
  response["version"] = kApiVersion;
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_stats(const crow::request &req) {
  nlohmann::json response = create_success_response("Vector store statistics");
  response["total_vectors"] = services_->get_retrieval_store().total_vectors();
  response["embedding_dimension"] = services_->get_retrieval_store().dimension();
  return create_json_response(response);
}

crow::response Routes::handle_upload(const crow::request &req) {
  std::string document_name;
  try {
    auto json_body = parse_json_body(req.body);
    document_name = json_body.value("document_name", "");
    std::string text = json_body.value("text", "");

    if (rag_core::is_blank(document_name)) {
      return create_json_response(create_error_response("document_name is required"), 400);
    }
    if (rag_core::is_blank(text)) {
      return create_json_response(
          create_error_response("No text could be extracted from '" + document_name +
                                "'. It might be empty or corrupted."),
          400);
    }

    std::cout << "Uploading document: " << document_name << std::endl;
    rag_core::IngestResult result = services_->get_ingestion_service().ingest_text(document_name, text);

    nlohmann::json response = create_success_response(
        result.chunks_added > 0
            ? "File processed and content added to vector store successfully."
            : "File processed, but no valid text chunks were generated.");
    response["filename"] = result.document_name;
    response["chunks_added"] = result.chunks_added;
    response["total_vectors_in_store"] = result.total_vectors;
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body: " + std::string(e.what())),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const rag_core::RetrievalStoreError &e) {
    std::cerr << "Store rejected upload of '" << document_name << "': " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_upload: " << e.what() << std::endl;
    return create_json_response(
        create_error_response("An unexpected error occurred processing the file: " +
                              std::string(e.what())),
        500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string query = json_body.value("query", "");
    int top_k = json_body.value("top_k", services_->get_search_service().default_top_k());

    std::vector<rag_core::ChunkSearchResult> results = services_->get_search_service().search(query, top_k);

    nlohmann::json sources = nlohmann::json::array();
    for (const rag_core::ChunkSearchResult &result : results) {
      nlohmann::json source;
      source["document_name"] = result.document_name;
      source["chunk_id"] = result.chunk_number;
      source["text_preview"] = result.text;
      source["score"] = result.score;
      sources.push_back(source);
    }

    nlohmann::json response = create_success_response("Search completed");
    response["sources"] = sources;
    std::cout << "Chunk results: " << sources.size() << std::endl;
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body: " + std::string(e.what())),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_reset(const crow::request &req) {
  size_t remaining = services_->get_retrieval_store().reset();
  nlohmann::json response = create_success_response("Vector store has been successfully reset.");
  response["total_vectors_in_store"] = remaining;
  return create_json_response(response);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace rag_api
