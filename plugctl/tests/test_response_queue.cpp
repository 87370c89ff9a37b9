#include "correlator.hpp"
#include "response_queue.hpp"

#include <cassert>
#include <chrono>
#include <thread>

using namespace plugctl;
using namespace std::chrono;

static Bytes frame_of_type(uint16_t type, uint8_t marker) {
    FrameHeader h;
    h.command = type;
    h.sequence = marker;
    return build_frame(h, nullptr, 0);
}

static uint16_t marker_of(const Bytes& frame) {
    return rd16_le(frame.data() + WIRE_OFF_SEQUENCE);
}

int main() {
    // Bounded: pushes beyond depth are dropped, never block.
    ResponseQueue small(3);
    assert(small.push(frame_of_type(1, 1)));
    assert(small.push(frame_of_type(1, 2)));
    assert(small.push(frame_of_type(1, 3)));
    assert(!small.push(frame_of_type(1, 4)));
    assert(small.size() == 3);
    assert(small.dropped() == 1);

    Bytes out;
    assert(small.pop(out, milliseconds(0)) && marker_of(out) == 1);

    small.clear();
    assert(small.size() == 0);
    assert(small.dropped() == 0);
    assert(!small.pop(out, milliseconds(0)));
    assert(small.push(frame_of_type(1, 5)));
    assert(small.pop(out, milliseconds(0)) && marker_of(out) == 5);

    ResponseQueue queue;
    assert(queue.depth() == 1000);
    ResponseCorrelator corr(queue);
    Error err;

    // Unconditional wait takes whatever is next.
    queue.push(frame_of_type(0x3e9, 7));
    bool ok = corr.recv(milliseconds(100), out, err);
    (void)ok;
    assert(ok);
    assert(marker_of(out) == 7);

    // Nothing queued: timeout, no earlier than the deadline and not much later.
    auto t0 = steady_clock::now();
    assert(!corr.recv(milliseconds(150), out, err));
    auto waited = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert(err.kind == ErrorKind::TIMEOUT);
    assert(waited >= milliseconds(150));
    assert(waited < milliseconds(1000));

    t0 = steady_clock::now();
    err = Error{};
    assert(!corr.wait_for_type(0x3e9, milliseconds(200), out, err));
    waited = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert(err.kind == ErrorKind::TIMEOUT);
    assert(waited >= milliseconds(200));
    assert(waited < milliseconds(1000));

    // Typed wait skips earlier frames and pushes them back to the tail.
    queue.push(frame_of_type(0x6a, 1));
    queue.push(frame_of_type(0x6a, 2));
    queue.push(frame_of_type(0x3e9, 3));
    assert(corr.wait_for_type(0x3e9, milliseconds(500), out, err));
    assert(marker_of(out) == 3);
    assert(queue.size() == 2);
    assert(corr.recv(milliseconds(10), out, err) && marker_of(out) == 1);
    assert(corr.recv(milliseconds(10), out, err) && marker_of(out) == 2);

    // A mismatched frame alone in the queue cycles until the deadline, then
    // stays queued for the next caller.
    queue.push(frame_of_type(0x6a, 9));
    t0 = steady_clock::now();
    err = Error{};
    assert(!corr.wait_for_type(0x3e9, milliseconds(100), out, err));
    waited = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert(err.kind == ErrorKind::TIMEOUT);
    assert(waited >= milliseconds(100));
    assert(queue.size() == 1);
    assert(corr.recv(milliseconds(10), out, err) && marker_of(out) == 9);

    // A match arriving from another thread mid-wait is delivered.
    std::thread producer([&queue] {
        std::this_thread::sleep_for(milliseconds(50));
        queue.push(frame_of_type(0x6a, 20));
        queue.push(frame_of_type(0x3e9, 21));
    });
    assert(corr.wait_for_type(0x3e9, milliseconds(2000), out, err));
    assert(marker_of(out) == 21);
    producer.join();
    assert(queue.size() == 1);

    return 0;
}
