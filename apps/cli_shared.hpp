#pragma once

#include "covmap/core/errors.hpp"
#include "covmap/core/events.hpp"

#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace covmap::cli {

// Unbuffered fan-out: every write goes to all sinks in order.
class TeeBuf : public std::streambuf {
public:
  explicit TeeBuf(std::vector<std::streambuf *> sinks);

protected:
  int overflow(int c) override;
  std::streamsize xsputn(const char *s, std::streamsize n) override;
  int sync() override;

private:
  std::vector<std::streambuf *> sinks_;
};

// Prints "[ERROR] <STAGE>: <message>" and closes the run with success=false.
// Returns the process exit status.
int report_failure(core::EventEmitter &emitter, const std::string &run_id,
                   const CovmapError &error, std::ostream &events);

} // namespace covmap::cli
