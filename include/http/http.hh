#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wren::http {

class StatusCode
{
public:
  enum Value : unsigned
  {
    Ok = 200,
    BadRequest = 400,
    NotFound = 404,
    InternalServerError = 500,
  };

  constexpr StatusCode(Value value)
    : m_value(value) {};

  constexpr unsigned code() const { return m_value; }
  char const* reason() const;

  constexpr bool operator==(StatusCode const&) const = default;

private:
  Value m_value;
};

class Request
{
public:
  Request() = default;
  Request(std::string method, std::string uri, std::string http_version)
    : m_method(std::move(method))
    , m_uri(std::move(uri))
    , m_httpVersion(std::move(http_version)) {};

  std::string const& method() const { return m_method; }
  std::string const& uri() const { return m_uri; }
  std::string const& http_version() const { return m_httpVersion; }

  /* keys are stored lower-cased, lookups are lower-cased too */
  std::optional<std::string> header(std::string_view key) const;

  /* returns the value it replaced, if any */
  std::optional<std::string> set_header(std::string_view key,
                                        std::string value);

  std::map<std::string, std::string> const& headers() const
  {
    return m_headers;
  }

private:
  std::string m_method;
  std::string m_uri;
  std::string m_httpVersion;
  std::map<std::string, std::string> m_headers;
};

class Response
{
public:
  explicit Response(StatusCode status)
    : m_status(status) {};

  static Response ok() { return Response(StatusCode::Ok); }
  static Response with_status_code(StatusCode status)
  {
    return Response(status);
  }

  StatusCode status_code() const { return m_status; }

  /* header names keep their case on the wire,
   * but lookup and replacement ignore it */
  std::optional<std::string> header(std::string_view key) const;
  std::optional<std::string> set_header(std::string_view key,
                                        std::string value);

  std::map<std::string, std::string> const& headers() const
  {
    return m_headers;
  }

  std::vector<std::byte> const& body() const { return m_body; }
  std::size_t body_len() const { return m_body.size(); }

  void extend(std::span<std::byte const> bytes);
  void extend(std::string_view text);

private:
  StatusCode m_status;
  std::map<std::string, std::string> m_headers;
  std::vector<std::byte> m_body;
};

/* the first line must split on single spaces into exactly three tokens,
 * every later line holding a ':' is taken as a header */
std::optional<Request>
parse_request(std::span<std::byte const> bytes);

/* status line, headers, blank line, body */
std::vector<std::byte>
serialize_response(Response const& res);

std::string
to_lower(std::string_view);

};
