#include "cli_shared.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace covmap::cli {

TeeBuf::TeeBuf(std::vector<std::streambuf *> sinks) : sinks_(std::move(sinks)) {}

int TeeBuf::overflow(int c) {
  if (traits_type::eq_int_type(c, traits_type::eof()))
    return traits_type::not_eof(c);
  const char ch = traits_type::to_char_type(c);
  return xsputn(&ch, 1) == 1 ? c : traits_type::eof();
}

std::streamsize TeeBuf::xsputn(const char *s, std::streamsize n) {
  std::streamsize written = n;
  for (auto *sink : sinks_) {
    written = std::min(written, sink->sputn(s, n));
  }
  return written;
}

int TeeBuf::sync() {
  int rc = 0;
  for (auto *sink : sinks_) {
    if (sink->pubsync() != 0)
      rc = -1;
  }
  return rc;
}

int report_failure(core::EventEmitter &emitter, const std::string &run_id,
                   const CovmapError &error, std::ostream &events) {
  std::cerr << "[ERROR] " << error.stage() << ": " << error.what() << std::endl;
  emitter.run_end(run_id, false, "error",
                  {{"stage", error.stage()}, {"error", error.what()}}, events);
  return 1;
}

} // namespace covmap::cli
