#include "core/Expecter.hpp"
#include "Shared.hpp"
#include "util/Trace.hpp"

#include <cstdio>
#include <thread>

namespace tether::core {

namespace {

// Source lines -> receive. Closes receive on the first terminal condition,
// after handing over a trailing line that had no newline.
void source_loop(std::shared_ptr<Expecter::Shared> s,
                 std::shared_ptr<util::Channel<std::string>> receive) {
  for (;;) {
    LineRead lr;
    {
      std::lock_guard<std::mutex> lk(s->read_mu);
      lr = read_until_locked(*s, '\n');
    }
    if (!lr.status.ok()) {
      if (!lr.line.empty()) (void)receive->send(std::move(lr.line));
      util::trace("interact: source closed: %s", to_string(lr.status.error));
      break;
    }
    if (!receive->send(std::move(lr.line))) break;
  }
  receive->close();
}

// send -> sink, verbatim, until the caller closes send.
void sink_loop(std::shared_ptr<Expecter::Shared> s,
               std::shared_ptr<util::Channel<std::string>> send) {
  while (auto msg = send->receive()) {
    auto st = write_to_sink(*s, *msg);
    if (st.error == ExpectError::NoSink) {
      std::fprintf(stderr, "tether: interact: no sink, dropped %zu bytes\n", msg->size());
      continue;
    }
    if (!st.ok()) {
      std::fprintf(stderr, "tether: interact: write failed: %s %s\n",
                   to_string(st.error), st.detail.c_str());
      break;
    }
  }
}

} // namespace

InteractChannels Expecter::start_interactive_session() {
  InteractChannels ch{std::make_shared<util::Channel<std::string>>(),
                      std::make_shared<util::Channel<std::string>>()};
  std::thread(source_loop, s_, ch.receive).detach();
  std::thread(sink_loop, s_, ch.send).detach();
  return ch;
}

} // namespace tether::core
