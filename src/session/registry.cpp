#include "session/registry.hpp"
#include "util/log.hpp"

namespace session
{

SessionPtr Registry::get(const std::string &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(id);
    if (it == map_.end() || !it->second->alive())
        return nullptr;
    return it->second;
}

bool Registry::put(SessionPtr s)
{
    if (!s)
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(s->id());
    if (it != map_.end() && it->second->alive())
    {
        LOG_WARN("Registry::put: %s already has a live session", s->id().c_str());
        return false;
    }
    map_[s->id()] = std::move(s);
    return true;
}

bool Registry::remove(const std::string &id, const Session *only)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(id);
    if (it == map_.end() || it->second.get() != only)
        return false;
    map_.erase(it);
    LOG_DEBUG("Registry::remove: %s", id.c_str());
    return true;
}

std::size_t Registry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

std::vector<SessionPtr> Registry::all() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SessionPtr>     out;
    for (const auto &kv : map_)
        out.push_back(kv.second);
    return out;
}

}  // namespace session
