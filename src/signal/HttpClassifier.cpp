#include "signal/HttpClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using namespace tribunal;
using json = nlohmann::json;

namespace {

std::once_flag g_curl_init;

struct CurlHandleDeleter {
    void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); }
};

struct CurlListDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};

} // namespace

HttpClassifier::HttpClassifier(ClassifierConfig cfg)
    : cfg_(std::move(cfg)) {
    // curl_global_init is not thread-safe; run it exactly once per process.
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    std::cout << "[CLASSIFIER] Endpoint: " << cfg_.endpoint
              << " model=" << (cfg_.model.empty() ? "(default)" : cfg_.model)
              << " timeout=" << cfg_.timeout.count() << "ms\n";
}

size_t HttpClassifier::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

ProducerOutcome HttpClassifier::produce(const EvaluationInput& input,
                                        std::chrono::milliseconds timeout) {
    if (cfg_.endpoint.empty())
        return ProducerOutcome::skipped(SignalSource::CLASSIFIER);

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl)
        return ProducerOutcome::failed(SignalSource::CLASSIFIER, "curl_easy_init failed");

    std::string body;
    try {
        body = json{
            {"model",        cfg_.model},
            {"content",      input.text},
            {"content_type", input.content_type.empty() ? "text" : input.content_type},
            {"context",      input.context}
        }.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return ProducerOutcome::failed(SignalSource::CLASSIFIER,
                                       std::string("request encode failed: ") + e.what());
    }

    // --- Headers ---
    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, "Content-Type: application/json");
    raw = curl_slist_append(raw, "Accept: application/json");
    std::string auth_hdr;
    if (!cfg_.api_key.empty()) {
        auth_hdr = "Authorization: Bearer " + cfg_.api_key;
        raw = curl_slist_append(raw, auth_hdr.c_str());
    }
    std::unique_ptr<curl_slist, CurlListDeleter> headers(raw);

    // Caller's deadline wins when it is tighter than the configured one.
    auto bound = std::min(timeout, cfg_.timeout);
    long timeout_ms = static_cast<long>(std::max<int64_t>(1, bound.count()));

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL,               cfg_.endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER,        headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST,              1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS,        body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,     static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,     write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,         &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,        timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    // Worker threads: no SIGALRM-based DNS timeouts.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,          1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::cerr << "[CLASSIFIER] Request failed: " << curl_easy_strerror(res) << "\n";
        return ProducerOutcome::failed(SignalSource::CLASSIFIER,
                                       res == CURLE_OPERATION_TIMEDOUT
                                           ? std::string("timeout")
                                           : std::string("transport: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status == 204) return ProducerOutcome::nothing(SignalSource::CLASSIFIER, {{"http_status", 204}});
    if (status < 200 || status >= 300) {
        std::cerr << "[CLASSIFIER] HTTP " << status << "\n";
        return ProducerOutcome::failed(SignalSource::CLASSIFIER,
                                       "http status " + std::to_string(status));
    }

    return parse_verdict(response);
}

// ---------------------------------------------------------------------------
// Verdict parsing. The classifier's own `decision` is kept as evidence only;
// the merger derives the decision from risk_level.
// ---------------------------------------------------------------------------
ProducerOutcome HttpClassifier::parse_verdict(const std::string& body) {
    json v;
    try {
        v = json::parse(body);
    } catch (const std::exception& e) {
        return ProducerOutcome::failed(SignalSource::CLASSIFIER,
                                       std::string("malformed verdict: ") + e.what());
    }

    if (!v.is_object() || !v.contains("risk_level") || !v["risk_level"].is_string())
        return ProducerOutcome::failed(SignalSource::CLASSIFIER, "verdict missing risk_level");

    auto risk = parseRiskLevel(v["risk_level"].get<std::string>());
    if (!risk)
        return ProducerOutcome::failed(SignalSource::CLASSIFIER,
                                       "verdict has unknown risk_level '" +
                                       v["risk_level"].get<std::string>() + "'");

    if (!v.contains("confidence_score") || !v["confidence_score"].is_number())
        return ProducerOutcome::failed(SignalSource::CLASSIFIER, "verdict missing confidence_score");

    double confidence = v["confidence_score"].get<double>();
    if (!std::isfinite(confidence))
        return ProducerOutcome::failed(SignalSource::CLASSIFIER, "verdict confidence not finite");

    EvaluationSignal sig;
    sig.source     = SignalSource::CLASSIFIER;
    sig.risk_level = *risk;
    sig.confidence = confidence;
    if (v.contains("explanation") && v["explanation"].is_string())
        sig.rationale = v["explanation"].get<std::string>();

    if (v.contains("policy_tags") && v["policy_tags"].is_array()) {
        for (const auto& t : v["policy_tags"]) {
            if (t.is_string()) sig.tags.push_back(t.get<std::string>());
        }
    }

    sig.raw_evidence = v;
    return ProducerOutcome::produced(std::move(sig));
}
