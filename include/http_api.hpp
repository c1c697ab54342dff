#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include "retrieval_service.hpp"

namespace pulse_rag {

// JSON endpoints over a RetrievalService. Handlers are public so they can
// be driven without a socket.
class HttpApi {
public:
    HttpApi(RetrievalService& service, int default_k);

    void register_routes(httplib::Server& server);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_retrieve(const httplib::Request& req, httplib::Response& res);
    void handle_add_documents(const httplib::Request& req, httplib::Response& res);
    void handle_document_count(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_reset(const httplib::Request& req, httplib::Response& res);

    static nlohmann::json to_json(const RetrievalResult& result);

private:
    // Runs `body`, mapping our exception types onto HTTP status codes.
    template<typename Func>
    void guarded(const char* route, httplib::Response& res, Func body);

    RetrievalService& service_;
    int default_k_;
};

} // namespace pulse_rag
