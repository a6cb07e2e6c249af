#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Request line in, reply line out (no trailing newline on either side).
using Handler = std::function<std::string(const std::string &line)>;

// Serves one request per connection until a "QUIT" request has been answered.
// Each request runs on its own thread, so the handler must be thread safe; QUIT is
// answered inline and the server returns once running requests have finished.
// A null handler answers "OK" to everything.
bool start_server(const std::string &sock_path, const Handler &on_line);

// Sends `line` and reads the single reply line into `reply`.
bool request(const std::string &sock_path, const std::string &line, std::string &reply);

std::string expand_user(const std::string &path);

}  // namespace ipc
