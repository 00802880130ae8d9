#include "submission/SubmissionClient.hpp"
#include "core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using namespace tessera;
using json = nlohmann::json;

SubmissionClient::SubmissionClient(const std::string& base_url, long timeout_sec)
    : base_(base_url), timeout_sec_(timeout_sec) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
    curl_ = curl_easy_init();
    if (!curl_) throw TransportError("[SUBMIT] curl_easy_init failed");
    std::cout << "[SUBMIT] Server " << base_ << "\n";
}

SubmissionClient::~SubmissionClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

size_t SubmissionClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string SubmissionClient::perform(const std::string& method,
                                      const std::string& path,
                                      const std::string& body,
                                      const std::string& content_type,
                                      long& http_status) {
    std::string url = base_ + path;
    std::string response;

    struct curl_slist* headers = nullptr;
    if (!content_type.empty()) {
        std::string ct = "Content-Type: " + content_type;
        headers = curl_slist_append(headers, ct.c_str());
    }
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        timeout_sec_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST,              1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS,        body.data());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(body.size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);
    if (res != CURLE_OK)
        throw TransportError(std::string("[SUBMIT] ") + method + " " + url + " failed: " +
                             curl_easy_strerror(res));

    http_status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status >= 500)
        throw TransportError("[SUBMIT] " + url + " returned HTTP " + std::to_string(http_status));
    return response;
}

Verdict SubmissionClient::submit(const WireSubmission& wire) {
    EncodedBody enc = encode_multipart(wire);

    long status = 0;
    std::string resp = perform("POST", "/submit", enc.body, enc.content_type, status);
    std::cout << "[SUBMIT] HTTP " << status << " " << resp << "\n";

    json j;
    try {
        j = json::parse(resp);
    } catch (const json::exception&) {
        throw TransportError("[SUBMIT] non-JSON response (HTTP " + std::to_string(status) + ")");
    }
    return Verdict::from_json(j);
}

TaskInfo SubmissionClient::fetch_task() {
    long status = 0;
    std::string resp = perform("GET", "/get_task", "", "", status);
    if (status != 200)
        throw TransportError("[SUBMIT] get_task returned HTTP " + std::to_string(status));

    TaskInfo t;
    try {
        json j = json::parse(resp);
        t.task_id               = j.at("task_id").get<std::string>();
        t.performance_threshold = j.value("performance_threshold", 0.0);
        t.validation_data_hash  = j.value("validation_data_hash", std::string());
    } catch (const json::exception& e) {
        throw TransportError(std::string("[SUBMIT] bad get_task response: ") + e.what());
    }
    std::cout << "[SUBMIT] Task " << t.task_id << " threshold=" << t.performance_threshold << "\n";
    return t;
}
