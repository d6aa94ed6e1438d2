#include "core/RuneReader.hpp"
#include <algorithm>

namespace tether::core {

RuneReader::RuneReader(std::shared_ptr<io::IByteSource> source)
    : source_(std::move(source)) {}

Status RuneReader::pull_one() {
  char b = 0;
  for (;;) {
    auto r = source_->read(&b, 1);
    if (r.status != io::StreamStatus::Ok) return status_from_stream(r.status, r.err);
    if (r.count == 1) break;
  }
  staging_.push_back(b);
  return {};
}

RuneRead RuneReader::read_rune() {
  RuneRead out;
  for (;;) {
    if (!staging_.empty()) {
      auto d = util::decode_utf8(staging_.data(), staging_.size());
      if (d.state == util::Utf8State::Complete) {
        out.code_point = d.code_point;
        out.size = d.size;
        std::copy_n(staging_.begin(), d.size, out.bytes.begin());
        staging_.erase(0, static_cast<size_t>(d.size));
        return out;
      }
      if (d.state == util::Utf8State::Invalid || staging_.size() >= util::kUtf8Max) {
        staging_.erase(0, 1);
        out.status = {ExpectError::MalformedEncoding, {}};
        return out;
      }
    }
    out.status = pull_one();
    if (!out.status.ok()) return out;
  }
}

Status RuneReader::read_byte(char& out) {
  if (staging_.empty()) {
    auto st = pull_one();
    if (!st.ok()) return st;
  }
  out = staging_.front();
  staging_.erase(0, 1);
  return {};
}

LineRead RuneReader::read_until(char delim) {
  LineRead lr;
  char c = 0;
  for (;;) {
    lr.status = read_byte(c);
    if (!lr.status.ok()) return lr;
    if (c == delim) return lr;
    lr.line.push_back(c);
  }
}

void RuneReader::unread(std::string_view bytes) {
  staging_.insert(0, bytes.data(), bytes.size());
}

} // namespace tether::core
