#include "net/CurlHttpClient.hpp"
#include "net/ProcUtil.hpp"

#include <cctype>
#include <utility>

namespace net {

static const char* kStatusMarker = "__SECTIONSCOUT_HTTP_STATUS__:";

CurlHttpClient::CurlHttpClient(CurlConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> CurlHttpClient::build_argv(const std::string& url, int timeout_secs) const {
    std::vector<std::string> argv = {
        cfg_.curl_path,
        "--silent",
        "--location",
        "--compressed",
        "--max-time", std::to_string(timeout_secs > 0 ? timeout_secs : 15),
        "--user-agent", cfg_.user_agent,
        "--header", "Accept: " + cfg_.accept,
        "--header", "Accept-Language: " + cfg_.accept_language,
        "--write-out", std::string("\n") + kStatusMarker + "%{http_code}",
        url
    };
    return argv;
}

bool CurlHttpClient::split_status(const std::string& output, std::string& body, int& status) {
    const std::string marker = std::string("\n") + kStatusMarker;
    const size_t pos = output.rfind(marker);
    if (pos == std::string::npos) return false;

    std::string code = output.substr(pos + marker.size());
    while (!code.empty() && std::isspace(static_cast<unsigned char>(code.back()))) code.pop_back();
    if (code.empty()) return false;
    for (unsigned char c : code) {
        if (!std::isdigit(c)) return false;
    }

    body = output.substr(0, pos);
    status = std::stoi(code);
    return true;
}

HttpResponse CurlHttpClient::get(const std::string& url, int timeout_secs) {
    HttpResponse resp;

    const procutil::ProcResult pr = procutil::run_capture_stdout(build_argv(url, timeout_secs));
    if (pr.exit_code < 0) {
        resp.error = "failed to start " + cfg_.curl_path;
        return resp;
    }
    if (pr.exit_code != 0) {
        resp.error = "curl exited with code " + std::to_string(pr.exit_code);
        return resp;
    }

    if (!split_status(pr.output, resp.body, resp.status)) {
        resp.body.clear();
        resp.status = 0;
        resp.error = "malformed curl output (no status line)";
    }
    return resp;
}

}  // namespace net
