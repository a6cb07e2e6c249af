#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "session/session.hpp"

namespace session
{

using SessionPtr = std::shared_ptr<Session>;

// Device id -> live session, at most one per id.
class Registry
{
  public:
    // nullptr unless a live session is registered under `id`
    SessionPtr get(const std::string &id) const;

    // Refused while a live session holds the id; a dead leftover is replaced.
    bool put(SessionPtr s);

    // Removes the entry only if it is `only`, so a stale teardown cannot evict a successor.
    bool remove(const std::string &id, const Session *only);

    std::size_t             size() const;
    std::vector<SessionPtr> all() const;

  private:
    mutable std::mutex                mu_;
    std::map<std::string, SessionPtr> map_;
};

}  // namespace session
