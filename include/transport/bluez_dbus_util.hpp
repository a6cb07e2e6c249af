// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#if APDULINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace transport
{

inline bool ieq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

inline bool mac_eq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::toupper((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF", "" when not a device path
inline std::string addr_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return "";
    std::string tail = obj_path.substr(pos + 5);
    if (tail.find('/') != std::string::npos)
        return "";
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return tail;
}

#if APDULINK_HAVE_SDBUS
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

// read variant "s" (also used for "o" via `type`)
inline int read_var_s(sd_bus_message *m, std::string &out, char type = 's')
{
    const char sig[2] = {type, '\0'};
    int        r      = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, sig);
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read_basic(m, type, &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// read variant "b"
inline int read_var_b(sd_bus_message *m, bool &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

// read variant "as"
inline int read_var_as(sd_bus_message *m, std::vector<std::string> &out)
{
    out.clear();
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *u  = nullptr;
        int         rr = sd_bus_message_read_basic(m, 's', &u);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (u)
            out.emplace_back(u);
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -1 : 0;
}

// a{sv} entry builders; all return the first negative sd-bus code
inline int append_sv_s(sd_bus_message *msg, const char *key, const char *val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0)
        r = sd_bus_message_append(msg, "s", key);
    if (r >= 0)
        r = sd_bus_message_append(msg, "v", "s", val);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);
    return r;
}

inline int append_sv_b(sd_bus_message *msg, const char *key, bool val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0)
        r = sd_bus_message_append(msg, "s", key);
    if (r >= 0)
        r = sd_bus_message_append(msg, "v", "b", (int)val);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);
    return r;
}

inline int append_sv_q(sd_bus_message *msg, const char *key, uint16_t val)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0)
        r = sd_bus_message_append(msg, "s", key);
    if (r >= 0)
        r = sd_bus_message_append(msg, "v", "q", val);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);
    return r;
}

inline int append_sv_as(sd_bus_message *msg, const char *key, const std::vector<std::string> &vals)
{
    int r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0)
        r = sd_bus_message_append(msg, "s", key);
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as");
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "s");
    for (const auto &v : vals)
    {
        if (r < 0)
            break;
        r = sd_bus_message_append(msg, "s", v.c_str());
    }
    if (r >= 0)
        r = sd_bus_message_close_container(msg);  // array
    if (r >= 0)
        r = sd_bus_message_close_container(msg);  // variant
    if (r >= 0)
        r = sd_bus_message_close_container(msg);  // dict
    return r;
}
#endif

}  // namespace transport
