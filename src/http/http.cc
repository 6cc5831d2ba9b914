#include <algorithm>
#include <cctype>
#include <cstring>

#include "http/http.hh"

using namespace wren;
using namespace wren::http;

namespace {

std::string_view
trim(std::string_view str)
{
  auto const is_space = [](char c) { return std::isspace((unsigned char)c); };

  while (!str.empty() && is_space(str.front()))
    str.remove_prefix(1);
  while (!str.empty() && is_space(str.back()))
    str.remove_suffix(1);
  return str;
}

bool
iequals(std::string_view lhs, std::string_view rhs)
{
  return std::ranges::equal(lhs, rhs, [](char a, char b) {
    return std::tolower((unsigned char)a) == std::tolower((unsigned char)b);
  });
}

};

std::string
http::to_lower(std::string_view str)
{
  std::string out(str);
  for (char& c : out)
    c = char(std::tolower((unsigned char)c));
  return out;
}

char const*
StatusCode::reason() const
{
  switch (m_value) {
    case Ok:
      return "OK";
    case BadRequest:
      return "Bad Request";
    case NotFound:
      return "Not Found";
    case InternalServerError:
      return "Internal Server Error";
  }
  return "Unknown";
}

std::optional<std::string>
Request::header(std::string_view key) const
{
  auto it = m_headers.find(to_lower(key));
  if (it == m_headers.end())
    return std::nullopt;
  return it->second;
}

std::optional<std::string>
Request::set_header(std::string_view key, std::string value)
{
  auto [it, inserted] = m_headers.try_emplace(to_lower(key), value);
  if (inserted)
    return std::nullopt;
  return std::exchange(it->second, std::move(value));
}

std::optional<std::string>
Response::header(std::string_view key) const
{
  for (auto const& [k, v] : m_headers)
    if (iequals(k, key))
      return v;
  return std::nullopt;
}

std::optional<std::string>
Response::set_header(std::string_view key, std::string value)
{
  for (auto& [k, v] : m_headers)
    if (iequals(k, key))
      return std::exchange(v, std::move(value));

  m_headers.emplace(std::string(key), std::move(value));
  return std::nullopt;
}

void
Response::extend(std::span<std::byte const> bytes)
{
  m_body.insert(m_body.end(), bytes.begin(), bytes.end());
}

void
Response::extend(std::string_view text)
{
  extend(std::as_bytes(std::span(text.data(), text.size())));
}

std::optional<Request>
http::parse_request(std::span<std::byte const> bytes)
{
  std::string_view msg((char const*)bytes.data(), bytes.size());

  if (msg.empty())
    return std::nullopt;

  std::optional<Request> req;

  while (!msg.empty()) {
    auto const eol = msg.find('\n');
    std::string_view line = msg.substr(0, eol);
    msg.remove_prefix(eol == std::string_view::npos ? msg.size() : eol + 1);

    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);

    if (!req) {
      std::vector<std::string_view> tokens;
      for (std::size_t pos = 0;;) {
        auto const space = line.find(' ', pos);
        tokens.push_back(line.substr(pos, space - pos));
        if (space == std::string_view::npos)
          break;
        pos = space + 1;
      }

      if (tokens.size() != 3)
        return std::nullopt;

      req.emplace(std::string(tokens[0]),
                  std::string(tokens[1]),
                  std::string(tokens[2]));
      continue;
    }

    auto const colon = line.find(':');
    if (colon == std::string_view::npos)
      continue;

    req->set_header(trim(line.substr(0, colon)),
                    std::string(trim(line.substr(colon + 1))));
  }

  return req;
}

std::vector<std::byte>
http::serialize_response(Response const& res)
{
  std::string head = "HTTP/1.1 ";
  head += std::to_string(res.status_code().code());
  head += ' ';
  head += res.status_code().reason();
  head += "\r\n";

  for (auto const& [key, value] : res.headers()) {
    head += key;
    head += ": ";
    head += value;
    head += "\r\n";
  }

  head += "\r\n";

  std::vector<std::byte> out;
  out.reserve(head.size() + res.body_len());

  auto const head_bytes = std::as_bytes(std::span(head.data(), head.size()));
  out.insert(out.end(), head_bytes.begin(), head_bytes.end());
  out.insert(out.end(), res.body().begin(), res.body().end());
  return out;
}
