// Engine state shared between an Expecter and the worker threads it spawns
// (timeout workers, interactive loops). Private to src/core.
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/Expecter.hpp"
#include "core/RuneReader.hpp"
#include "io/ByteStream.hpp"

namespace tether::core {

struct Expecter::Shared {
  Shared(std::shared_ptr<io::IByteSource> src, std::shared_ptr<io::IByteSink> snk)
      : source(std::move(src)), sink(std::move(snk)), reader(source) {}

  std::shared_ptr<io::IByteSource> source;
  std::shared_ptr<io::IByteSink> sink;

  // Guards everything below: held for the whole of one accumulation loop.
  std::mutex read_mu;
  RuneReader reader;
  std::optional<Status> terminal;  // sticky Eof / Io
  bool capturing{false};
  std::string captured;

  // Serializes writes from send() and the interactive sink loop.
  std::mutex write_mu;
};

// Write all of `text` to the sink; NoSink when the engine is read-only.
Status write_to_sink(Expecter::Shared& s, std::string_view text);

// Byte-level read through the staging area, honoring and recording the
// sticky terminal condition. Caller holds s.read_mu.
LineRead read_until_locked(Expecter::Shared& s, char delim);

} // namespace tether::core
