#pragma once
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tbproxy {

// Transport-free view of one HTTP request, handed from the session to the
// request workers.
struct ApiRequest {
  std::string method; // "GET", "POST", ...
  std::string path;   // target without the query string
  std::map<std::string, std::string> headers; // names lower-cased
  std::string body;
  std::string remote_address; // socket peer, may be empty

  // name must be lower-case; nullptr when absent
  const std::string *header(const std::string &name) const {
    auto it = headers.find(name);
    return it == headers.end() ? nullptr : &it->second;
  }
};

struct ApiResponse {
  int status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body; // JSON

  void set_header(std::string name, std::string value) {
    headers.emplace_back(std::move(name), std::move(value));
  }
};

// Back channel to the network side; writes happen on the connection's strand.
struct ReplyHandle {
  std::function<void(ApiResponse)> respond;
};

} // namespace tbproxy
