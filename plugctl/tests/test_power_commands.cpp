#include "fake_device.hpp"
#include "log.hpp"
#include "payloads.hpp"
#include "power_client.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>

using namespace plugctl;
using namespace std::chrono;

static std::atomic<uint8_t> g_status{0};
static std::atomic<uint16_t> g_error{0};
static std::atomic<bool> g_junk_payload{false};

static ClientConfig config_for(const FakeDevice& device, uint16_t type) {
    ClientConfig cfg;
    cfg.device_ip = "127.0.0.1";
    cfg.device_port = device.port();
    cfg.device_mac = "34:ea:34:0a:0b:0c";
    cfg.device_type = type;
    cfg.bind_ip = "127.0.0.1";
    cfg.command_timeout_ms = 500;
    cfg.auth_timeout_ms = 500;
    cfg.log_level = PLUGCTL_LOG_ERROR;
    return cfg;
}

// Last request's decrypted 16-byte command payload.
static Bytes last_payload(const FakeDevice& device) {
    const SessionCipher cipher;
    Bytes p = request_payload(device.requests().back(), cipher);
    p.resize(kCommandPayloadLen);
    return p;
}

int main() {
    set_log_level(PLUGCTL_LOG_ERROR);
    const SessionCipher cipher;

    FakeDevice device;
    bool started = device.start([&cipher](const Bytes& req) -> std::vector<Bytes> {
        const Bytes p = request_payload(req, cipher);
        Bytes answer(16, 0);
        if (!p.empty() && p[0] == SP_SUBCMD_QUERY) answer[SP_OFF_STATE] = g_status.load();
        if (!p.empty() && p[0] == 0x0a) answer[MP_OFF_STATUS] = g_status.load();

        if (g_junk_payload.load()) {
            // Error reply whose payload is not even whole cipher blocks.
            FrameHeader h;
            h.command = WIRE_CMD_COMMAND;
            h.error_code = g_error.load();
            const uint8_t junk[7] = {1, 2, 3, 4, 5, 6, 7};
            return {build_frame(h, junk, sizeof(junk))};
        }
        return {make_reply(WIRE_CMD_COMMAND, g_error.load(), cipher, answer)};
    });
    (void)started;
    assert(started);

    // ---- single relay ----
    PowerClient plug;
    bool opened = plug.open(config_for(device, 0x2711));
    (void)opened;
    assert(opened);
    assert(plug.family() == DeviceFamily::SINGLE_RELAY);

    assert(plug.set_power(true));
    assert(plug.last_error().ok());
    Bytes p = last_payload(device);
    assert(p[0] == 0x02 && p[4] == 0x01);
    assert(plug.set_power(false));
    p = last_payload(device);
    assert(p[0] == 0x02 && p[4] == 0x00);

    bool on = false;
    g_status = 0xfd;
    assert(plug.query_power(on) && on);
    assert(last_payload(device)[0] == 0x01);
    g_status = 0x03;
    assert(plug.query_power(on) && on);
    g_status = 0x00;
    assert(plug.query_power(on) && !on);

    // Device error code surfaces before any decryption.
    g_error = 0xfffb;
    g_junk_payload = true;
    assert(!plug.query_power(on));
    assert(plug.last_error().kind == ErrorKind::PROTOCOL);
    assert(plug.last_error().code == 0xfffb);
    g_junk_payload = false;
    assert(!plug.set_power(true));
    assert(plug.last_error().kind == ErrorKind::PROTOCOL);
    assert(!plug.last_error().ok());
    g_error = 0;

    // Strip operations are refused without touching the wire.
    const size_t sent = device.requests().size();
    uint8_t mask = 0;
    assert(!plug.set_power_mask(0x01, true));
    assert(plug.last_error().kind == ErrorKind::NOT_SUPPORTED);
    assert(!plug.set_power_by_index(1, true));
    assert(plug.last_error().kind == ErrorKind::NOT_SUPPORTED);
    assert(!plug.query_power_raw(mask));
    assert(plug.last_error().kind == ErrorKind::NOT_SUPPORTED);
    assert(device.requests().size() == sent);

    plug.close();
    const auto t0 = steady_clock::now();
    assert(!plug.set_power(true));
    assert(plug.last_error().kind == ErrorKind::TRANSPORT);
    assert(steady_clock::now() - t0 < milliseconds(100));

    // ---- multi relay ----
    PowerClient strip;
    assert(strip.open(config_for(device, 0x4eb5)));
    assert(strip.family() == DeviceFamily::MULTI_RELAY);

    assert(strip.set_power_mask(0x01, true));
    const Bytes by_mask = last_payload(device);
    assert(strip.set_power_by_index(1, true));
    const Bytes by_index = last_payload(device);
    assert(by_mask == by_index);

    assert(strip.set_power_by_index(3, true));
    p = last_payload(device);
    assert(p[MP_OFF_MASK] == 0x04);
    assert(p[MP_OFF_ENABLED] == 0x04);
    assert(p[MP_OFF_CONTROL] == static_cast<uint8_t>((0x04 << 1) + 0xb2));

    assert(strip.set_power_mask(0x05, false));
    p = last_payload(device);
    assert(p[MP_OFF_CONTROL] == 0x05 + 0xb2);
    assert(p[MP_OFF_MASK] == 0x05);
    assert(p[MP_OFF_ENABLED] == 0x00);

    const size_t before_bad_index = device.requests().size();
    assert(!strip.set_power_by_index(0, true));
    assert(strip.last_error().kind == ErrorKind::MALFORMED);
    assert(device.requests().size() == before_bad_index);

    g_status = 0x0b;
    assert(strip.query_power_raw(mask));
    assert(mask == 0x0b);
    p = last_payload(device);
    assert(p[0] == 0x0a && p[6] == 0xae && p[8] == 0x01);

    g_error = 0x0001;
    assert(!strip.query_power_raw(mask));
    assert(strip.last_error().kind == ErrorKind::PROTOCOL);
    assert(strip.last_error().code == 0x0001);
    g_error = 0;

    assert(!strip.set_power(true));
    assert(strip.last_error().kind == ErrorKind::NOT_SUPPORTED);
    assert(!strip.query_power(on));
    assert(strip.last_error().kind == ErrorKind::NOT_SUPPORTED);
    strip.close();

    // ---- unknown model ----
    PowerClient unknown;
    assert(unknown.open(config_for(device, 0x1234)));
    assert(unknown.family() == DeviceFamily::UNKNOWN);
    assert(!unknown.set_power(true));
    assert(unknown.last_error().kind == ErrorKind::NOT_SUPPORTED);
    assert(unknown.last_error().message == "Not supported");
    assert(!unknown.query_power(on));
    assert(!unknown.set_power_mask(1, true));
    assert(!unknown.set_power_by_index(1, true));
    assert(!unknown.query_power_raw(mask));
    assert(unknown.last_error().kind == ErrorKind::NOT_SUPPORTED);
    unknown.close();

    device.stop();
    return 0;
}
