#ifndef TRIAGEGUARD_RECOGNIZER_HTTP_RECOGNITION_DETECTOR_HPP
#define TRIAGEGUARD_RECOGNIZER_HTTP_RECOGNITION_DETECTOR_HPP

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>
#include "detectors.hpp"
#include "../core/types.hpp"

namespace triageguard {
namespace recognizer {

/**
 * @brief Detector backed by an external entity-recognition service.
 *
 * POSTs {"text": "..."} and expects
 * {"entities":[{"start":0,"end":9,"type":"EMAIL","score":0.8}, ...]}.
 * Offsets are byte offsets into the posted text. Network, HTTP and parse
 * failures are thrown; the engine treats this detector as non-secret, so a
 * failure only degrades recognition quality.
 */
class HttpRecognitionDetector : public Detector {
  public:
    HttpRecognitionDetector(const std::string& endpoint, long timeoutMillis)
        : m_endpoint(endpoint), m_timeoutMillis(timeoutMillis) {
        initCurl();
    }

    std::string Name() const override { return "http_backend"; }

    core::EntityClass Class() const override { return core::EntityClass::PersonalIdentifier; }

    std::vector<core::EntitySpan> Detect(const std::string& text) const override {
        nlohmann::json request = {{"text", text}};
        std::string response;
        long status = httpPost(m_endpoint, request.dump(), response);
        if (status != 200) {
            throw std::runtime_error("recognition backend returned HTTP " + std::to_string(status));
        }
        return parseEntities(response, text.size());
    }

    /**
     * @brief Parse a backend response body. Unknown entity types and out-of-range
     *        offsets are dropped.
     * @throw nlohmann::json::exception on malformed JSON.
     */
    static std::vector<core::EntitySpan> parseEntities(const std::string& body, size_t textSize) {
        std::vector<core::EntitySpan> spans;
        nlohmann::json parsed = nlohmann::json::parse(body);
        const nlohmann::json& entities = parsed.at("entities");
        if (!entities.is_array()) {
            throw std::runtime_error("recognition backend: 'entities' is not an array");
        }
        for (const auto& e : entities) {
            core::EntityType type;
            if (!core::ParseEntityTypeTag(e.at("type").get<std::string>(), type)) {
                continue;
            }
            core::EntitySpan span;
            span.start = e.at("start").get<size_t>();
            span.end = e.at("end").get<size_t>();
            span.type = type;
            span.confidence = e.value("score", 0.5);
            if (span.start >= span.end || span.end > textSize) {
                continue;
            }
            spans.push_back(span);
        }
        return spans;
    }

  private:
    void initCurl() {
        static std::once_flag flag;
        std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        if (!userdata)
            return 0;
        std::string* resp = reinterpret_cast<std::string*>(userdata);
        size_t total = size * nmemb;
        resp->append(ptr, total);
        return total;
    }

    // Returns the HTTP status; throws on transport failure.
    long httpPost(const std::string& url, const std::string& body, std::string& responseOut) const {
        CURL* curl = curl_easy_init();
        if (!curl)
            throw std::runtime_error("curl_easy_init failed");

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_timeoutMillis);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw std::runtime_error(std::string("recognition backend unreachable: ") +
                                     curl_easy_strerror(res));
        }
        return status;
    }

    std::string m_endpoint;
    long m_timeoutMillis;
};

} // namespace recognizer
} // namespace triageguard

#endif // TRIAGEGUARD_RECOGNIZER_HTTP_RECOGNITION_DETECTOR_HPP
