#ifndef COURIER_MODEL_HPP
#define COURIER_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace http::model {
    enum class RequestMethod {
        HEAD,
        OPTIONS,
        GET,
        POST,
        PUT,
        PATCH,
        DELETE,
    };

    [[nodiscard]] const char* to_string(RequestMethod method);

    class Header {
       public:
        Header(std::string name, std::string value);

        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] const std::string& value() const { return value_; }

       private:
        std::string name_;
        std::string value_;
    };

    class Request {
       public:
        virtual ~Request() = default;

        [[nodiscard]] RequestMethod method() const { return method_; }

        // Interceptors may edit both in place before dispatch.
        std::vector<Header> headers_;
        std::string url_;

       protected:
        Request(RequestMethod method, std::string url);
        Request(const Request&) = default;
        Request& operator=(const Request&) = default;
        Request(Request&&) = default;
        Request& operator=(Request&&) = default;

       private:
        RequestMethod method_;
    };

    class RequestWithBody : public Request {
       public:
        std::string body_;

       protected:
        RequestWithBody(RequestMethod method, std::string url, std::string body);
    };

    class HeadRequest : public Request {
       public:
        explicit HeadRequest(std::string url);
    };

    class OptionsRequest : public Request {
       public:
        explicit OptionsRequest(std::string url);
    };

    class GetRequest : public Request {
       public:
        explicit GetRequest(std::string url);
    };

    class DeleteRequest : public Request {
       public:
        explicit DeleteRequest(std::string url);
    };

    class PostRequest : public RequestWithBody {
       public:
        PostRequest(std::string url, std::string body);
    };

    class PutRequest : public RequestWithBody {
       public:
        PutRequest(std::string url, std::string body);
    };

    class PatchRequest : public RequestWithBody {
       public:
        PatchRequest(std::string url, std::string body);
    };

    // ASCII case-insensitive ordering, so "content-type" and "Content-Type" share one entry.
    struct CaseInsensitiveLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const;
    };

    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    class Response {
       public:
        Response(long status_code, std::string body, HeaderMap headers);

        [[nodiscard]] long status_code() const { return status_code_; }
        [[nodiscard]] const std::string& body() const { return body_; }
        [[nodiscard]] const HeaderMap& headers() const { return headers_; }
        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

       private:
        long status_code_;
        std::string body_;
        HeaderMap headers_;
    };
}  // namespace http::model

#endif
