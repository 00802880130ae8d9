#pragma once
#include <string>
#include <curl/curl.h>
#include "submission/Multipart.hpp"
#include "verify/Verdict.hpp"

namespace tessera {

struct TaskInfo {
    std::string task_id;
    double      performance_threshold{0.0};
    std::string validation_data_hash;
};

// ---------------------------------------------------------------------------
// HTTP transport to the evaluation server.
//   POST <base>/submit    multipart wire unit -> Verdict
//   GET  <base>/get_task  -> TaskInfo
// Network failures and 5xx throw TransportError: the submission was not
// judged, sending it again is reasonable. A Verdict is a judgement: resending
// an identical payload will not change it. No retry in here.
// curl_global_init() must have been called by main().
// ---------------------------------------------------------------------------
class SubmissionClient {
public:
    SubmissionClient(const std::string& base_url, long timeout_sec);
    ~SubmissionClient();

    SubmissionClient(const SubmissionClient&) = delete;
    SubmissionClient& operator=(const SubmissionClient&) = delete;

    Verdict  submit(const WireSubmission& wire);
    TaskInfo fetch_task();

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    // Returns the body; http_status receives the response code.
    std::string perform(const std::string& method,
                        const std::string& path,
                        const std::string& body,
                        const std::string& content_type,
                        long& http_status);

    CURL*       curl_{nullptr};
    std::string base_;
    long        timeout_sec_;
};

} // namespace tessera
