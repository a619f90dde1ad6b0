#include "model.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace http::model {
    const char* to_string(RequestMethod method) {
        switch (method) {
            case RequestMethod::HEAD:
                return "HEAD";
            case RequestMethod::OPTIONS:
                return "OPTIONS";
            case RequestMethod::GET:
                return "GET";
            case RequestMethod::POST:
                return "POST";
            case RequestMethod::PUT:
                return "PUT";
            case RequestMethod::PATCH:
                return "PATCH";
            case RequestMethod::DELETE:
                return "DELETE";
        }
        return "GET";
    }

    Header::Header(std::string name, std::string value) : name_(std::move(name)), value_(std::move(value)) {}

    Request::Request(RequestMethod method, std::string url) : url_(std::move(url)), method_(method) {}

    RequestWithBody::RequestWithBody(RequestMethod method, std::string url, std::string body) : Request(method, std::move(url)), body_(std::move(body)) {}

    HeadRequest::HeadRequest(std::string url) : Request(RequestMethod::HEAD, std::move(url)) {}

    OptionsRequest::OptionsRequest(std::string url) : Request(RequestMethod::OPTIONS, std::move(url)) {}

    GetRequest::GetRequest(std::string url) : Request(RequestMethod::GET, std::move(url)) {}

    DeleteRequest::DeleteRequest(std::string url) : Request(RequestMethod::DELETE, std::move(url)) {}

    PostRequest::PostRequest(std::string url, std::string body) : RequestWithBody(RequestMethod::POST, std::move(url), std::move(body)) {}

    PutRequest::PutRequest(std::string url, std::string body) : RequestWithBody(RequestMethod::PUT, std::move(url), std::move(body)) {}

    PatchRequest::PatchRequest(std::string url, std::string body) : RequestWithBody(RequestMethod::PATCH, std::move(url), std::move(body)) {}

    bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                            [](char x, char y) { return string_utils::ascii_lower(x) < string_utils::ascii_lower(y); });
    }

    Response::Response(long status_code, std::string body, HeaderMap headers)
        : status_code_(status_code), body_(std::move(body)), headers_(std::move(headers)) {}

    std::optional<std::string> Response::header(std::string_view name) const {
        auto it = headers_.find(name);
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}  // namespace http::model
