#include "rag_api/routes.hpp"

#include <iostream>

#include "rag_api/json_mapping.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/corpus_loader.hpp"
#include "rag_core/services/retriever.hpp"
#include "rag_core/services/service_provider.hpp"
#include "rag_core/storage/corpus_repository.hpp"

namespace rag_api {
Routes::Routes(rag_core::ServiceProvider &services) : services_(services) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/retrieve").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_retrieve(req);
  });

  CROW_ROUTE(app, "/api/corpus")
  ([this](const crow::request &req) { return handle_corpus_status(req); });

  CROW_ROUTE(app, "/api/corpus/reload")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_corpus_reload(req); });

  CROW_ROUTE(app, "/api/runs")
  ([this](const crow::request &req) { return handle_list_runs(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("RAG retrieval API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_retrieve(const crow::request &req) {
  rag_core::Retriever &retriever = services_.get_retriever();
  try {
    const nlohmann::json body = nlohmann::json::parse(req.body);
    const rag_core::RetrievalRequest request =
        retrieval_request_from_json(body, retriever.defaults());

    if (!services_.get_corpus_loader().current()) {
      return create_json_response(create_error_response("No corpus has been published yet"), 503);
    }

    std::cout << "Retrieve for: " << request.query_text << " with top_k: " << request.top_k
              << std::endl;
    const rag_core::RetrievalResult result = retriever.retrieve(request);
    std::cout << "Results: " << result.chunks.size() << " from version " << result.corpus_version
              << std::endl;
    return create_json_response(retrieval_result_to_json(result));
  } catch (const nlohmann::json::parse_error &) {
    return create_json_response(create_error_response("Malformed JSON body"), 400);
  } catch (const BadRequestError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const rag_core::RetrievalError &e) {
    std::cerr << "Exception in handle_retrieve: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_retrieve: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_corpus_status(const crow::request &) {
  try {
    std::optional<rag_core::CorpusManifest> active = services_.get_repository().active_manifest();
    if (!active) {
      return create_json_response(create_error_response("No corpus has been published yet"), 404);
    }
    nlohmann::json data = manifest_summary_to_json(*active);
    std::shared_ptr<const rag_core::CorpusSnapshot> snapshot =
        services_.get_corpus_loader().current();
    data["loaded_version"] = snapshot ? snapshot->manifest.version : "";
    return create_json_response(create_success_response("Active corpus", data));
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_corpus_status: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_corpus_reload(const crow::request &) {
  try {
    rag_core::CorpusLoader &loader = services_.get_corpus_loader();
    const bool reloaded = loader.refresh();
    std::shared_ptr<const rag_core::CorpusSnapshot> snapshot = loader.current();
    nlohmann::json data;
    data["reloaded"] = reloaded;
    data["version"] = snapshot ? snapshot->manifest.version : "";
    return create_json_response(
        create_success_response(reloaded ? "Corpus reloaded" : "Corpus already current", data));
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_corpus_reload: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_runs(const crow::request &req) {
  try {
    size_t limit = 10;
    if (const char *param = req.url_params.get("limit")) {
      const int parsed = std::stoi(param);
      if (parsed <= 0) {
        return create_json_response(create_error_response("limit must be greater than 0"), 400);
      }
      limit = static_cast<size_t>(parsed);
    }

    nlohmann::json runs = nlohmann::json::array();
    for (const auto &run : services_.get_repository().recent_runs(limit)) {
      runs.push_back(run_record_to_json(run));
    }
    nlohmann::json response = create_success_response("Runs retrieved successfully");
    response["data"]["runs"] = runs;
    response["data"]["count"] = runs.size();
    return create_json_response(response);
  } catch (const std::invalid_argument &) {
    return create_json_response(create_error_response("Invalid limit"), 400);
  } catch (const std::out_of_range &) {
    return create_json_response(create_error_response("Invalid limit"), 400);
  } catch (const rag_core::RagError &e) {
    std::cerr << "Exception in handle_list_runs: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
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

}  // namespace rag_api
