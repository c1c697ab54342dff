#include "http_api.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>

namespace pulse_rag {

using json = nlohmann::json;

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

json parse_body(const httplib::Request& req) {
    if (req.body.empty()) throw ValidationError("No JSON data provided");
    try {
        auto body = json::parse(req.body);
        if (!body.is_object()) throw ValidationError("Request body must be a JSON object");
        return body;
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Malformed JSON: ") + e.what());
    }
}

int parse_k(const json& value) {
    if (!value.is_number_integer()) throw ValidationError("'k' must be an integer");
    constexpr int64_t max_k = std::numeric_limits<int>::max();
    if (value.is_number_unsigned() ? value.get<uint64_t>() > static_cast<uint64_t>(max_k)
                                   : value.get<int64_t>() > max_k) {
        throw ValidationError("'k' is out of range");
    }
    int64_t k = value.get<int64_t>();
    if (k < 1) throw ValidationError("k must be a positive integer");
    return static_cast<int>(k);
}

MetadataFilter parse_filter(const json& body) {
    MetadataFilter filter;
    auto it = body.find("filter");
    if (it == body.end() || it->is_null()) return filter;
    if (!it->is_object()) throw ValidationError("'filter' must be an object of strings");
    for (const auto& [key, value] : it->items()) {
        if (!value.is_string()) throw ValidationError("Filter value for '" + key + "' must be a string");
        filter[key] = value.get<std::string>();
    }
    return filter;
}

} // namespace

HttpApi::HttpApi(RetrievalService& service, int default_k) : service_(service), default_k_(default_k) {}

template<typename Func>
void HttpApi::guarded(const char* route, httplib::Response& res, Func body) {
    try {
        body();
    } catch (const ValidationError& e) {
        send_json(res, 400, json{{"error", e.what()}});
    } catch (const EmbeddingError& e) {
        spdlog::error("❌ {} failed: {}", route, e.what());
        send_json(res, 503, json{{"error", e.what()}, {"retryable", true}});
    } catch (const ServiceStateError& e) {
        send_json(res, 503, json{{"error", e.what()}});
    } catch (const std::exception& e) {
        spdlog::error("❌ {} failed: {}", route, e.what());
        send_json(res, 500, json{{"error", e.what()}});
    }
}

void HttpApi::register_routes(httplib::Server& server) {
    server.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });

    server.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    server.Post("/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
        handle_retrieve(req, res);
    });
    server.Post("/add_documents", [this](const httplib::Request& req, httplib::Response& res) {
        handle_add_documents(req, res);
    });
    server.Get("/documents/count", [this](const httplib::Request& req, httplib::Response& res) {
        handle_document_count(req, res);
    });
    server.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    server.Post("/reset", [this](const httplib::Request& req, httplib::Response& res) {
        handle_reset(req, res);
    });

    server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) {
            send_json(res, 404, json{{"error", "Not found"}});
        }
    });
}

json HttpApi::to_json(const RetrievalResult& result) {
    return json{
        {"id", result.position},
        {"score", result.score},
        {"rank", result.rank},
        {"content", result.document.content},
        {"module", result.document.module},
        {"sub_module", result.document.sub_module},
        {"issue_type", result.document.issue_type},
        {"sub_issue_type", result.document.sub_issue_type},
        {"source", result.document.source}
    };
}

void HttpApi::handle_health(const httplib::Request&, httplib::Response& res) {
    auto report = service_.health_check();
    json body = {
        {"status", report.status},
        {"documents_count", report.document_count},
        {"index_size", report.index_size},
        {"dimension", report.dimension},
        {"embedding_model_ready", report.embedding_model_ready},
        {"model", report.model},
        {"cache_entries", report.cache_entries}
    };
    if (!report.error.empty()) body["error"] = report.error;
    send_json(res, report.status == "healthy" ? 200 : 503, body);
}

void HttpApi::handle_retrieve(const httplib::Request& req, httplib::Response& res) {
    guarded("retrieve", res, [&]() {
        auto body = parse_body(req);

        auto query_it = body.find("query");
        if (query_it == body.end() || !query_it->is_string() || query_it->get<std::string>().empty()) {
            throw ValidationError("Missing 'query' parameter");
        }
        std::string query = query_it->get<std::string>();

        int k = default_k_;
        if (body.contains("k") && !body["k"].is_null()) {
            k = parse_k(body["k"]);
        }

        auto results = service_.retrieve(query, k, parse_filter(body));

        json list = json::array();
        for (const auto& r : results) list.push_back(to_json(r));
        send_json(res, 200, json{{"results", list}, {"query", query}});
    });
}

void HttpApi::handle_add_documents(const httplib::Request& req, httplib::Response& res) {
    guarded("add_documents", res, [&]() {
        auto body = parse_body(req);

        auto docs_it = body.find("documents");
        if (docs_it == body.end() || !docs_it->is_array() || docs_it->empty()) {
            throw ValidationError("Missing 'documents' parameter");
        }

        std::string source = "Unknown";
        if (body.contains("source") && body["source"].is_string() && !body["source"].get<std::string>().empty()) {
            source = body["source"].get<std::string>();
        }

        std::vector<RawDocument> raw;
        raw.reserve(docs_it->size());
        for (const auto& item : *docs_it) {
            raw.push_back(RawDocument::from_json(item));
        }

        auto result = service_.add_documents(raw, source);
        send_json(res, 200, json{
            {"message", "Successfully added " + std::to_string(result.added_count) + " documents"},
            {"added_count", result.added_count},
            {"skipped_count", result.skipped_count},
            {"failed_count", result.failed_count},
            {"start_id", result.start_position},
            {"source", source},
            {"total_documents", result.total_documents},
            {"persisted", result.persisted}
        });
    });
}

void HttpApi::handle_document_count(const httplib::Request&, httplib::Response& res) {
    guarded("documents/count", res, [&]() {
        send_json(res, 200, json{{"count", service_.document_count()}});
    });
}

void HttpApi::handle_stats(const httplib::Request&, httplib::Response& res) {
    guarded("stats", res, [&]() {
        auto s = service_.stats();
        send_json(res, 200, json{
            {"success", true},
            {"index_size", s.index_size},
            {"documents_count", s.documents_count},
            {"embedding_model", s.embedding_model},
            {"index_dimension", s.index_dimension},
            {"cache_entries", s.cache_entries},
            {"cache_hits", s.cache_hits},
            {"cache_misses", s.cache_misses},
            {"last_updated", s.last_updated}
        });
    });
}

void HttpApi::handle_reset(const httplib::Request&, httplib::Response& res) {
    guarded("reset", res, [&]() {
        service_.reset();
        send_json(res, 200, json{{"success", true}, {"total_documents", service_.document_count()}});
    });
}

} // namespace pulse_rag
