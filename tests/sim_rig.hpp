// tests/sim_rig.hpp
#pragma once
#include <memory>

#include "session/session.hpp"
#include "transport/sim_link.hpp"

// One simulated device, connected, with its write and notify characteristics picked out.
// Declare sessions after the rig so they go first.
struct SimRig
{
    transport::SimLink          link;
    transport::SimDevice       *dev = nullptr;
    transport::ICharacteristic *wr  = nullptr;
    transport::ICharacteristic *nt  = nullptr;

    explicit SimRig(const transport::SimPeerConfig &cfg = transport::SimPeerConfig{})
    {
        dev = &link.add_peer(cfg);
        if (!dev->connect())
            return;
        for (auto *svc : dev->discover_services())
        {
            if (svc->uuid() != cfg.service_uuid)
                continue;
            for (auto *c : svc->characteristics())
            {
                if (c->can_write())
                    wr = c;
                if (c->can_notify())
                    nt = c;
            }
        }
    }

    // Subscribed session whose link loss is wired the way the controller does it.
    std::shared_ptr<session::Session> make_session()
    {
        auto s = std::make_shared<session::Session>(*dev, *wr, *nt);
        if (!s->subscribe())
            return nullptr;
        std::weak_ptr<session::Session> weak = s;
        dev->set_on_disconnect([weak] {
            if (auto live = weak.lock())
                live->on_link_lost();
        });
        return s;
    }
};
