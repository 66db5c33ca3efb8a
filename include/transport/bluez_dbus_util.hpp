// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#if TILELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

static inline bool ieq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

#if TILELINK_HAVE_SDBUS
// unref and null a slot ptr
[[maybe_unused]] static inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"; sd-bus writes an int
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_ay(sd_bus_message *m, std::vector<uint8_t> &out)
{
    // read variant "ay"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0)
        return r;
    const void *buf = nullptr;
    size_t      len = 0;
    r               = sd_bus_message_read_array(m, 'y', &buf, &len);
    if (r >= 0)
    {
        const auto *p = static_cast<const uint8_t *>(buf);
        out.assign(p, p + (buf ? len : 0));
    }
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int var_as_has_uuid(sd_bus_message    *m,
                                                   const std::string &want_uuid,
                                                   bool              &hit)
{
    // read variant "as" and check if list contains want_uuid (case-insensitive)
    hit   = false;
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
        if (rr <= 0)
            break;
        if (u && ieq(u, want_uuid))
            hit = true;
    }
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r < 0 || r1 < 0 || r2 < 0) ? -1 : 0;
}

[[maybe_unused]] static inline int var_manufacturer_data(sd_bus_message       *m,
                                                         uint16_t              company,
                                                         std::vector<uint8_t> &out,
                                                         bool                 &hit)
{
    // read variant "a{qv}" (company id -> ay) and pick the entry for `company`
    hit   = false;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{qv}");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0)
    {
        uint16_t id = 0;
        if ((r = sd_bus_message_read(m, "q", &id)) < 0)
            return r;
        if (id == company)
        {
            if ((r = read_var_ay(m, out)) < 0)
                return r;
            hit = true;
        }
        else if ((r = sd_bus_message_skip(m, "v")) < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    int r1 = sd_bus_message_exit_container(m);
    int r2 = sd_bus_message_exit_container(m);
    return (r1 < 0 || r2 < 0) ? -1 : 0;
}
#endif
