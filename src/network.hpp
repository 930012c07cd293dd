#pragma once

#include <string>
#include <utility>
#include <vector>

#include <featureprobe/network.hpp>

namespace fp {

/* headers shared by every request to the FeatureProbe server */
std::vector<std::pair<std::string, std::string>> sharedHeaders(const std::string &serverSdkKey);

std::string userAgent();

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpResponse get(const HttpRequest &request) override;

    HttpResponse post(const HttpRequest &request) override;

private:
    HttpResponse perform(const HttpRequest &request, bool isPost);
};

} // namespace fp
